#pragma once
/** @file  ProvisioningStep.hpp
 *  @brief One idempotent unit of a provisioning plan.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>

#include "provisioning/Types.hpp"

namespace fieldkit {
  namespace provisioning {

    struct ExecutionContext;

    /**
 * @struct ProvisioningStep
 * @brief Separable precondition / apply / verify for one piece of state.
 *
 *  * `satisfied` short-circuits a Mutation step in apply mode ("already applied").
 *  * `apply` signals trouble by throwing; the orchestrator classifies it.
 *  * `verify` is the postcondition; also what verify mode evaluates.
 *  * Gate steps (host class, privilege context) also run ahead of the
 *    verify / restore / hardware-test modes.
 */
    struct ProvisioningStep {
      using Check = std::function<bool(ExecutionContext&)>;
      using Action = std::function<void(ExecutionContext&)>;

      std::string id;
      std::string title;
      Phase phase{ Phase::Elevated };
      Severity severity{ Severity::Fatal };
      StepKind kind{ StepKind::Mutation };
      bool gate{ false };

      Check satisfied; ///< optional
      Action apply;
      Check verify; ///< optional
    };

  } // namespace provisioning
} // namespace fieldkit
