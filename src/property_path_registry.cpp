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

#include <algorithm>

#include "property_path_registry.hpp"
#include "tinygltf_utils.hpp"

namespace propanim {

const PropertyPathNode* PropertyPathNode::child(std::string_view segment) const
{
  auto it = std::find_if(children.begin(), children.end(), [segment](const PropertyPathNode& c) { return c.name == segment; });
  return it != children.end() ? &(*it) : nullptr;
}

PropertyPathNode PropertyPathNode::group(std::string name, std::vector<PropertyPathNode> children)
{
  PropertyPathNode node;
  node.name     = std::move(name);
  node.children = std::move(children);
  return node;
}

PropertyPathNode PropertyPathNode::indexedGroup(std::string name, IndexedLookup lookup, std::vector<PropertyPathNode> children)
{
  PropertyPathNode node = group(std::move(name), std::move(children));
  node.indexed          = true;
  node.lookup           = std::move(lookup);
  return node;
}

PropertyPathNode PropertyPathNode::property(std::string name, ValueType valueType, std::string targetPath)
{
  PropertyPathNode node;
  node.name       = std::move(name);
  node.valueType  = valueType;
  node.targetPath = std::move(targetPath);
  return node;
}

//--------------------------------------------------------------------------------------------------
// Scene lookups
//
TargetObject findMaterial(const tinygltf::Model& model, int index)
{
  if(index < 0 || index >= static_cast<int>(model.materials.size()))
    return {};
  return {TargetObject::eMaterial, index, -1};
}

// A light is only live when a node instances it
TargetObject findLight(const tinygltf::Model& model, int index)
{
  if(index < 0 || index >= static_cast<int>(model.lights.size()))
    return {};

  for(size_t nodeID = 0; nodeID < model.nodes.size(); nodeID++)
  {
    if(model.nodes[nodeID].light == index)
    {
      return {TargetObject::eLight, index, static_cast<int>(nodeID)};
    }
  }
  return {};
}

//--------------------------------------------------------------------------------------------------
// glTF property -> target property
//
// materials/<i>/pbrMetallicRoughness/baseColorFactor          -> albedoColor (Color4)
// materials/<i>/pbrMetallicRoughness/metallicFactor           -> metallic
// materials/<i>/pbrMetallicRoughness/roughnessFactor          -> roughness
// materials/<i>/.../baseColorTexture/.../KHR_texture_transform -> albedoTexture.uvOffset, uvScale
// materials/<i>/emissiveFactor                                -> emissive
// extensions/KHR_lights_punctual/lights/<i>/color, intensity  -> diffuse, intensity
//
static PropertyPathNode buildRegistry()
{
  using Node = PropertyPathNode;

  Node textureTransform = Node::group(KHR_TEXTURE_TRANSFORM_EXTENSION_NAME,
                                      {
                                          Node::property("offset", ValueType::eVector2, "uvOffset"),
                                          Node::property("scale", ValueType::eVector2, "uvScale"),
                                      });

  Node baseColorTexture = Node::group("baseColorTexture", {Node::group("extensions", {std::move(textureTransform)})});
  baseColorTexture.targetPath = "albedoTexture";

  Node materials = Node::indexedGroup("materials", findMaterial,
                                      {
                                          Node::group("pbrMetallicRoughness",
                                                      {
                                                          Node::property("baseColorFactor", ValueType::eColor4, "albedoColor"),
                                                          Node::property("metallicFactor", ValueType::eFloat, "metallic"),
                                                          Node::property("roughnessFactor", ValueType::eFloat, "roughness"),
                                                          std::move(baseColorTexture),
                                                      }),
                                          Node::property("emissiveFactor", ValueType::eColor3, "emissive"),
                                      });

  Node lights = Node::indexedGroup("lights", findLight,
                                   {
                                       Node::property("color", ValueType::eColor3, "diffuse"),
                                       Node::property("intensity", ValueType::eFloat, "intensity"),
                                   });

  Node extensions = Node::group("extensions", {Node::group(KHR_LIGHTS_PUNCTUAL_EXTENSION_NAME, {std::move(lights)})});

  return Node::group("", {std::move(extensions), std::move(materials)});
}

const PropertyPathNode& propertyPathRegistry()
{
  static const PropertyPathNode registry = buildRegistry();
  return registry;
}

}  // namespace propanim
