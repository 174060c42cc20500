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
#include <cstring>
#include <new>

#include <fmt/format.h>

#include "gltf_accessor_reader.hpp"

namespace propanim {

namespace {

template <typename T>
T loadUnaligned(const unsigned char* ptr)
{
  T value{};
  std::memcpy(&value, ptr, sizeof(T));
  return value;
}

// Reads one component and converts it to float, following the glTF rules for normalized integers
bool readComponent(int componentType, bool normalized, const unsigned char* ptr, float& value)
{
  switch(componentType)
  {
    case TINYGLTF_COMPONENT_TYPE_FLOAT:
      value = loadUnaligned<float>(ptr);
      return true;
    case TINYGLTF_COMPONENT_TYPE_BYTE: {
      const float v = static_cast<float>(loadUnaligned<int8_t>(ptr));
      value         = normalized ? std::max(v / 127.f, -1.f) : v;
      return true;
    }
    case TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE: {
      const float v = static_cast<float>(loadUnaligned<uint8_t>(ptr));
      value         = normalized ? v / 255.f : v;
      return true;
    }
    case TINYGLTF_COMPONENT_TYPE_SHORT: {
      const float v = static_cast<float>(loadUnaligned<int16_t>(ptr));
      value         = normalized ? std::max(v / 32767.f, -1.f) : v;
      return true;
    }
    case TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT: {
      const float v = static_cast<float>(loadUnaligned<uint16_t>(ptr));
      value         = normalized ? v / 65535.f : v;
      return true;
    }
    case TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT:
      value = static_cast<float>(loadUnaligned<uint32_t>(ptr));
      return true;
    default:
      return false;
  }
}

size_t readIndex(int componentType, const unsigned char* ptr)
{
  switch(componentType)
  {
    case TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE:
      return loadUnaligned<uint8_t>(ptr);
    case TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT:
      return loadUnaligned<uint16_t>(ptr);
    default:
      return loadUnaligned<uint32_t>(ptr);
  }
}

AnimationError readError(int accessorIndex, const std::string& reason)
{
  return AnimationError{ErrorCode::eAccessorRead, fmt::format("/accessors/{}: {}", accessorIndex, reason)};
}

}  // namespace

GltfAccessorReader::GltfAccessorReader(const tinygltf::Model& model)
    : m_model(model)
{
}

const unsigned char* GltfAccessorReader::viewBytes(int bufferViewIndex, size_t byteOffset, size_t byteLength) const
{
  if(bufferViewIndex < 0 || bufferViewIndex >= static_cast<int>(m_model.bufferViews.size()))
    return nullptr;

  const tinygltf::BufferView& view = m_model.bufferViews[bufferViewIndex];
  if(view.buffer < 0 || view.buffer >= static_cast<int>(m_model.buffers.size()))
    return nullptr;

  const tinygltf::Buffer& buffer = m_model.buffers[view.buffer];
  if(view.byteOffset > buffer.data.size() || view.byteLength > buffer.data.size() - view.byteOffset)
    return nullptr;
  if(byteOffset > view.byteLength || byteLength > view.byteLength - byteOffset)
    return nullptr;

  return buffer.data.data() + view.byteOffset + byteOffset;
}

//--------------------------------------------------------------------------------------------------
// Reads the accessor as a flat float array
//
std::optional<AnimationError> GltfAccessorReader::readFloatAccessor(int accessorIndex, std::vector<float>& output) const
{
  output.clear();

  if(accessorIndex < 0 || accessorIndex >= static_cast<int>(m_model.accessors.size()))
    return readError(accessorIndex, "Invalid index");

  const tinygltf::Accessor& accessor      = m_model.accessors[accessorIndex];
  const int                 numComponents = tinygltf::GetNumComponentsInType(accessor.type);
  const int                 componentSize = tinygltf::GetComponentSizeInBytes(accessor.componentType);
  if(numComponents <= 0 || componentSize <= 0)
    return readError(accessorIndex, fmt::format("Unsupported type ({}, {})", accessor.type, accessor.componentType));

  // Element count must fit in one float vector
  if(accessor.count > output.max_size() / size_t(numComponents))
    return readError(accessorIndex, fmt::format("Invalid count ({})", accessor.count));

  const size_t         elementSize = size_t(numComponents) * componentSize;
  const unsigned char* bytes       = nullptr;
  int                  byteStride  = 0;

  // Sparse-only accessors (bufferView == -1) are zero-initialized, then patched
  if(accessor.bufferView >= 0)
  {
    if(accessor.bufferView >= static_cast<int>(m_model.bufferViews.size()))
      return readError(accessorIndex, fmt::format("Invalid buffer view ({})", accessor.bufferView));

    const tinygltf::BufferView& view = m_model.bufferViews[accessor.bufferView];
    byteStride                       = accessor.ByteStride(view);
    if(byteStride <= 0)
      return readError(accessorIndex, "Invalid byte stride");

    // The last element must end inside the view: count - 1 strides plus one element
    if(accessor.count > 0)
    {
      const size_t available = accessor.byteOffset <= view.byteLength ? view.byteLength - accessor.byteOffset : 0;
      if(elementSize > available || accessor.count - 1 > (available - elementSize) / size_t(byteStride))
        return readError(accessorIndex, "Data is out of the buffer view range");

      const size_t byteLength = size_t(byteStride) * (accessor.count - 1) + elementSize;
      bytes                   = viewBytes(accessor.bufferView, accessor.byteOffset, byteLength);
      if(bytes == nullptr)
        return readError(accessorIndex, "Data is out of the buffer view range");
    }
  }

  try
  {
    output.assign(accessor.count * numComponents, 0.0f);
  }
  catch(const std::bad_alloc&)
  {
    return readError(accessorIndex, fmt::format("Cannot allocate {} elements", accessor.count));
  }

  if(bytes != nullptr)
  {
    for(size_t i = 0; i < accessor.count; i++)
    {
      const unsigned char* element = bytes + size_t(byteStride) * i;
      for(int c = 0; c < numComponents; c++)
      {
        if(!readComponent(accessor.componentType, accessor.normalized, element + size_t(componentSize) * c,
                          output[i * numComponents + c]))
        {
          output.clear();
          return readError(accessorIndex, fmt::format("Unsupported component type ({})", accessor.componentType));
        }
      }
    }
  }

  return applySparse(accessorIndex, accessor, output);
}

//--------------------------------------------------------------------------------------------------
// Overwrites the elements listed in the sparse section of the accessor
//
std::optional<AnimationError> GltfAccessorReader::applySparse(int accessorIndex, const tinygltf::Accessor& accessor, std::vector<float>& output) const
{
  if(!accessor.sparse.isSparse || accessor.sparse.count <= 0)
    return std::nullopt;

  const auto& idxs = accessor.sparse.indices;
  if(!(idxs.componentType == TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE      //
       || idxs.componentType == TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT  //
       || idxs.componentType == TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT))
  {
    return readError(accessorIndex, "Unsupported sparse index type");
  }

  const size_t         count         = size_t(accessor.sparse.count);
  const int            numComponents = tinygltf::GetNumComponentsInType(accessor.type);
  const int            componentSize = tinygltf::GetComponentSizeInBytes(accessor.componentType);
  const size_t         indexSize     = size_t(tinygltf::GetComponentSizeInBytes(idxs.componentType));
  const size_t         elementSize   = size_t(numComponents) * componentSize;
  const unsigned char* idxBuffer     = viewBytes(idxs.bufferView, size_t(idxs.byteOffset), indexSize * count);
  const unsigned char* valBuffer =
      viewBytes(accessor.sparse.values.bufferView, size_t(accessor.sparse.values.byteOffset), elementSize * count);
  if(idxBuffer == nullptr || valBuffer == nullptr)
    return readError(accessorIndex, "Sparse data is out of the buffer view range");

  // Sparse values are tightly packed
  for(size_t pairIdx = 0; pairIdx < count; pairIdx++)
  {
    const size_t index = readIndex(idxs.componentType, idxBuffer + indexSize * pairIdx);
    if(index >= accessor.count)
      return readError(accessorIndex, fmt::format("Sparse index {} is out of range", index));

    const unsigned char* element = valBuffer + elementSize * pairIdx;
    for(int c = 0; c < numComponents; c++)
    {
      if(!readComponent(accessor.componentType, accessor.normalized, element + size_t(componentSize) * c,
                        output[index * numComponents + c]))
      {
        return readError(accessorIndex, fmt::format("Unsupported component type ({})", accessor.componentType));
      }
    }
  }
  return std::nullopt;
}

}  // namespace propanim
