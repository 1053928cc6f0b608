#pragma once
/** @file  PrivilegeScope.hpp
 *  @brief Run a hardware test under a given privilege context.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>

#include "provisioning/HardwareTestResult.hpp"

namespace fieldkit {
  namespace provisioning {

    using HardwareTest = std::function<HardwareTestResult()>;

    /**
 * @class PrivilegeScope
 * @brief Capability interface the harness retries through.
 *
 *  * `run()` returns the test's result or throws on a fault raised under that
 *    context; the harness never sees how the context was entered.
 */
    class PrivilegeScope {
    public:
      virtual ~PrivilegeScope() = default;

      virtual std::string name() const = 0;
      virtual HardwareTestResult run(const HardwareTest& test) = 0;
    };

    /// Whatever credentials this process already has.
    class CurrentPrivilege : public PrivilegeScope {
    public:
      std::string name() const override { return "current user"; }
      HardwareTestResult run(const HardwareTest& test) override { return test(); }
    };

    /**
 * @class AccountPrivilege
 * @brief fork, drop to \p account (initgroups/setgid/setuid), run, report back.
 *
 *  * The result crosses the pipe as JSON; a child-side exception comes back
 *    as `{"fault": "..."}` and is re-thrown here as std::runtime_error.
 *  * Dropping to another account needs root; dropping to ourselves always works.
 */
    class AccountPrivilege : public PrivilegeScope {
    public:
      explicit AccountPrivilege(std::string account) : account_{ std::move(account) } {}

      std::string name() const override { return "account " + account_; }
      HardwareTestResult run(const HardwareTest& test) override;

    private:
      std::string account_;
    };

  } // namespace provisioning
} // namespace fieldkit
