#pragma once

/// @file tts.hpp
/// @brief Umbrella header for the tabletop session core.

#include "tts/version.hpp"

#include "tts/foundation/config_manager.hpp"
#include "tts/foundation/error_code.hpp"
#include "tts/foundation/game_error.hpp"
#include "tts/foundation/game_logger.hpp"
#include "tts/foundation/game_result.hpp"
#include "tts/foundation/types.hpp"

#include "tts/game/character_types.hpp"
#include "tts/game/encounter_types.hpp"
#include "tts/game/turn_order.hpp"
#include "tts/game/vitality.hpp"

#include "tts/service/campaign_codec.hpp"
#include "tts/service/campaign_store.hpp"
#include "tts/service/campaign_types.hpp"
#include "tts/service/change_event.hpp"
#include "tts/service/combat_coordinator.hpp"
#include "tts/service/notification_router.hpp"
#include "tts/service/state_change.hpp"
#include "tts/service/tool_gateway.hpp"
