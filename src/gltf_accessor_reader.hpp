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
#include <vector>

#include <tinygltf/tiny_gltf.h>

#include "property_animation_types.hpp"

namespace propanim {

//--------------------------------------------------------------------------------------------------
// Source of sampler data: reads an accessor of the asset as a flat float array.
// Implementations must allow concurrent reads.
//--------------------------------------------------------------------------------------------------
class FloatAccessorReader
{
public:
  virtual ~FloatAccessorReader() = default;

  virtual std::optional<AnimationError> readFloatAccessor(int accessorIndex, std::vector<float>& output) const = 0;
};

/*-------------------------------------------------------------------------------------------------
# class `propanim::GltfAccessorReader`
> Reads the accessors of a `tinygltf::Model`.

All components of all elements are returned in order (a VEC3 accessor of `n` elements gives
`3 * n` floats). Handles:
- interleaved buffer views (byteStride)
- BYTE, UNSIGNED_BYTE, SHORT, UNSIGNED_SHORT and UNSIGNED_INT components, normalized or not
- sparse accessors, including sparse-only accessors without a buffer view

Every buffer access is range checked; failures are reported as eAccessorRead.
-------------------------------------------------------------------------------------------------*/
class GltfAccessorReader : public FloatAccessorReader
{
public:
  explicit GltfAccessorReader(const tinygltf::Model& model);

  std::optional<AnimationError> readFloatAccessor(int accessorIndex, std::vector<float>& output) const override;

private:
  // Returns the bytes of [byteOffset, byteOffset + byteLength) inside a buffer view, or nullptr
  const unsigned char* viewBytes(int bufferViewIndex, size_t byteOffset, size_t byteLength) const;

  std::optional<AnimationError> applySparse(int accessorIndex, const tinygltf::Accessor& accessor, std::vector<float>& output) const;

  const tinygltf::Model& m_model;
};

}  // namespace propanim
