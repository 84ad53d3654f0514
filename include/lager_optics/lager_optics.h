// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lager_optics.h
/// @brief Umbrella header for lager_optics.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/applicative.h>
#include <lager_optics/traversable.h>
#include <lager_optics/optics.h>
#include <lager_optics/traversal.h>
#include <lager_optics/combinators.h>
