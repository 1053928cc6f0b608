#pragma once
/** @file  TempDir.hpp
 *  @brief Scratch directory removed with everything in it at scope exit.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fieldkit {
  namespace test {

    class TempDir {
    public:
      TempDir() {
        const auto base = std::filesystem::temp_directory_path() / "fieldkit.XXXXXX";
        std::string tmpl = base.string();
        std::vector<char> name(tmpl.begin(), tmpl.end());
        name.push_back('\0');
        if (::mkdtemp(name.data()) == nullptr)
          throw std::runtime_error("mkdtemp failed");
        path_ = name.data();
      }
      ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
      }

      std::string path(const std::string& rel = {}) const {
        return rel.empty() ? path_.string() : (path_ / rel).string();
      }

      /// Writes \p content to \p rel (parents created); returns the absolute path.
      std::string write(const std::string& rel, const std::string& content) const {
        const auto p = path_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary | std::ios::trunc) << content;
        return p.string();
      }

      std::string read(const std::string& rel) const {
        std::ifstream in(path_ / rel, std::ios::binary);
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
      }

      TempDir(const TempDir&) = delete;
      TempDir& operator=(const TempDir&) = delete;

    private:
      std::filesystem::path path_;
    };

  } // namespace test
} // namespace fieldkit
