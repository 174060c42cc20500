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

#include <tinygltf/tiny_gltf.h>

#include "property_animation_types.hpp"
#include "property_path_registry.hpp"

namespace propanim {

//----------------------------------------------------------------------------------------------
// Resolves EXT_property_animation target paths against the property registry
//
// "materials/0/pbrMetallicRoughness/baseColorFactor" gives
//   targetPath = "albedoColor", valueType = Color4, object = material 0
//
// Empty segments are ignored, so "/materials//0/emissiveFactor/" is valid.
// The model is only read.
//----------------------------------------------------------------------------------------------
class TargetPathResolver
{
public:
  explicit TargetPathResolver(const tinygltf::Model& model, const PropertyPathNode& registry = propertyPathRegistry());

  // `context` prefixes the error message (the channel's JSON path)
  std::optional<AnimationError> resolve(const std::string& target, TargetDescriptor& descriptor, const std::string& context = {}) const;

private:
  const tinygltf::Model&  m_model;
  const PropertyPathNode& m_registry;
};

}  // namespace propanim
