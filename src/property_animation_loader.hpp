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

#include <optional>
#include <string>
#include <vector>

#include <tinygltf/tiny_gltf.h>

#include "animation_group.hpp"
#include "channel_assembler.hpp"
#include "gltf_accessor_reader.hpp"
#include "target_path_resolver.hpp"

namespace propanim {

struct LoaderSettings
{
  bool asyncLoad = false;  // Run channels and sampler reads on worker threads (std::launch::async)
};

/*-------------------------------------------------------------------------------------------------

# propanim::PropertyAnimationLoader

Loads the EXT_property_animation channels of the animations of a glTF model.
- Every channel of an animation is started before any is awaited
- The group is normalized once all channels are attached
- The first failing channel fails the animation; tracks already attached stay in the group
- `loadAll()` loads every animation carrying the extension; a failing animation does not
  affect the others

-------------------------------------------------------------------------------------------------*/
class PropertyAnimationLoader
{
public:
  explicit PropertyAnimationLoader(const tinygltf::Model& model, LoaderSettings settings = {});
  PropertyAnimationLoader(const tinygltf::Model& model, const FloatAccessorReader& reader, LoaderSettings settings = {});

  PropertyAnimationLoader(const PropertyAnimationLoader&)            = delete;
  PropertyAnimationLoader& operator=(const PropertyAnimationLoader&) = delete;

  bool        hasPropertyAnimation(int animationIndex) const;
  std::string animationName(int animationIndex) const;  // "Animation<i>" for unnamed animations

  std::optional<AnimationError> loadAnimation(int animationIndex, AnimationGroup& group) const;

  // Returns the number of animations that failed to load
  int loadAll(std::vector<AnimationGroup>& groups) const;

private:
  std::optional<AnimationError> parseChannels(const tinygltf::Value& extension, const std::string& context, std::vector<PropertyChannel>& channels) const;

  const tinygltf::Model&     m_model;
  LoaderSettings             m_settings;
  GltfAccessorReader         m_gltfReader;
  const FloatAccessorReader& m_reader;
  TargetPathResolver         m_resolver;
};

}  // namespace propanim
