/*
 * Copyright (c) 2024-2026, NVIDIA CORPORATION.  All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-FileCopyrightText: Copyright (c) 2024-2026, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <vector>

#include <tinygltf/json.hpp>

#include "animation_group.hpp"

namespace propanim {

// JSON view of decoded tracks, for inspection and diffing.
// Vectors and colors are arrays, quaternions are [x, y, z, w].
nlohmann::json toJson(const AnimationValue& value);
nlohmann::json toJson(const KeyframeTrack& track);
nlohmann::json toJson(const AnimationGroup& group);

// Writes {"animations": [...]} to a file, returns false on failure
bool exportGroups(const std::vector<AnimationGroup>& groups, const std::filesystem::path& filename);

}  // namespace propanim
