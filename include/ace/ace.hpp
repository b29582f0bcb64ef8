#pragma once

/// @file ace.hpp
/// @brief Umbrella header for the action combo engine.

#include "ace/version.hpp"
#include "ace/core/result.hpp"

#include "ace/foundation/config_manager.hpp"
#include "ace/foundation/engine_error.hpp"
#include "ace/foundation/engine_logger.hpp"
#include "ace/foundation/engine_result.hpp"
#include "ace/foundation/error_code.hpp"
#include "ace/foundation/types.hpp"

#include "ace/state/effect_expiry_registry.hpp"
#include "ace/state/state_store.hpp"
#include "ace/state/state_types.hpp"

#include "ace/targeting/entity_selection_cache.hpp"
#include "ace/targeting/target_resolver.hpp"
#include "ace/targeting/targeting_types.hpp"

#include "ace/rules/auxiliary_suggestion_engine.hpp"
#include "ace/rules/job_provider.hpp"
#include "ace/rules/job_registry.hpp"
#include "ace/rules/priority_rule_engine.hpp"
#include "ace/rules/rule_configuration.hpp"
#include "ace/rules/rule_types.hpp"

#include "ace/resolution/action_resolution_cache.hpp"
#include "ace/resolution/performance_controller.hpp"

#include "ace/engine/decision_engine.hpp"
#include "ace/engine/engine_config.hpp"
