#pragma once
/** @file  Plans.hpp
 *  @brief The two fixed provisioning plans of the camera appliance.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "provisioning/ProvisioningOrchestrator.hpp"

namespace fieldkit {
  namespace core {
    struct ApplianceConfig;
  } // namespace core

  namespace provisioning {

    /**
     * Root-run system setup: account, packages, files, interfaces, unit,
     * python environment, privilege grants, groups, then checks and the
     * hardware self-test. Needs grantWriter, serviceManager (system scope)
     * and harness in the context. One repository / group step per entry of \p cfg.
     */
    Plan elevatedPlan(const core::ApplianceConfig& cfg);

    /**
     * Account-run user setup. First refuses to run unless the elevated phase
     * left its unit descriptor behind. Needs serviceManager (user scope).
     */
    Plan unprivilegedPlan();

  } // namespace provisioning
} // namespace fieldkit
