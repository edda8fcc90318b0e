#pragma once
/**
 * @file kbh_store.hpp
 * @brief Layer 3: Persistent store built on kbh_service.
 *
 * Provides the abstract Store seam, the SQLite Database, the domain models and the
 * domain persistence services (boards, tasks, tags, dependencies, notes).
 */
#include "kbh_service.hpp"

#include <nlohmann/json.hpp>

#include "store/store.hpp"
#include "store/database.hpp"
#include "store/models.hpp"
#include "store/board_service.hpp"
#include "store/task_service.hpp"
#include "store/tag_service.hpp"
#include "store/dependency_service.hpp"
#include "store/note_service.hpp"
