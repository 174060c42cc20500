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

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <tinygltf/tiny_gltf.h>

#include "property_animation_types.hpp"

namespace propanim {

// Finds the scene object for an index segment, returns an invalid TargetObject if there is none
using IndexedLookup = std::function<TargetObject(const tinygltf::Model& model, int index)>;

/*-------------------------------------------------------------------------------------------------
# struct `propanim::PropertyPathNode`
> One segment of the animatable property tree.

A node groups children by segment name and may declare:
- `valueType`: the shape of the animated value
- `targetPath`: a fragment of the dotted path on the target object
- `indexed`: the next segment of the path is an index, resolved with `lookup` if set
-------------------------------------------------------------------------------------------------*/
struct PropertyPathNode
{
  std::string                   name;
  std::vector<PropertyPathNode> children;
  ValueType                     valueType = ValueType::eNone;
  std::string                   targetPath;
  bool                          indexed = false;
  IndexedLookup                 lookup;

  const PropertyPathNode* child(std::string_view segment) const;

  static PropertyPathNode group(std::string name, std::vector<PropertyPathNode> children);
  static PropertyPathNode indexedGroup(std::string name, IndexedLookup lookup, std::vector<PropertyPathNode> children);
  static PropertyPathNode property(std::string name, ValueType valueType, std::string targetPath);
};

// The registry of animatable properties, built once and never modified
const PropertyPathNode& propertyPathRegistry();

// Lookups bound to the indexed nodes of the registry
TargetObject findMaterial(const tinygltf::Model& model, int index);
TargetObject findLight(const tinygltf::Model& model, int index);

}  // namespace propanim
