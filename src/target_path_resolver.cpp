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

#include <charconv>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "target_path_resolver.hpp"

namespace propanim {

namespace {
// Splits on '/' and drops empty segments
std::vector<std::string_view> splitPath(std::string_view path)
{
  std::vector<std::string_view> segments;
  size_t                        start = 0;
  while(start <= path.size())
  {
    size_t end = path.find('/', start);
    if(end == std::string_view::npos)
      end = path.size();
    if(end > start)
      segments.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return segments;
}

std::optional<int> parseIndex(std::string_view segment)
{
  int                    index  = 0;
  const char*            first  = segment.data();
  const char*            last   = segment.data() + segment.size();
  std::from_chars_result result = std::from_chars(first, last, index);
  if(result.ec != std::errc{} || result.ptr != last || index < 0)
    return std::nullopt;
  return index;
}
}  // namespace

TargetPathResolver::TargetPathResolver(const tinygltf::Model& model, const PropertyPathNode& registry)
    : m_model(model)
    , m_registry(registry)
{
}

//--------------------------------------------------------------------------------------------------
// Walks the registry one segment at a time.
// Path fragments are appended in walk order, the last declared value type wins.
//
std::optional<AnimationError> TargetPathResolver::resolve(const std::string& target, TargetDescriptor& descriptor, const std::string& context) const
{
  auto invalid = [&](std::string_view reason) {
    return AnimationError{ErrorCode::eInvalidTargetPath,
                          fmt::format("{}: Invalid " EXT_PROPERTY_ANIMATION_EXTENSION_NAME " target path ({}): {}", context, target, reason)};
  };

  descriptor = {};
  std::vector<std::string_view> fragments;

  const std::vector<std::string_view> segments = splitPath(target);
  const PropertyPathNode*             node     = &m_registry;
  for(size_t segmentIndex = 0; segmentIndex < segments.size(); segmentIndex++)
  {
    const std::string_view segment = segments[segmentIndex];

    node = node->child(segment);
    if(node == nullptr)
    {
      return invalid(fmt::format("'{}' not found", segment));
    }

    if(node->indexed)
    {
      if(++segmentIndex >= segments.size())
      {
        return invalid(fmt::format("missing index after '{}'", segment));
      }

      const std::optional<int> index = parseIndex(segments[segmentIndex]);
      if(!index)
      {
        return invalid(fmt::format("'{}' is not an index", segments[segmentIndex]));
      }

      if(node->lookup)
      {
        descriptor.object = node->lookup(m_model, *index);
        if(!descriptor.object.valid())
        {
          return invalid(fmt::format("no {} at index {}", segment, *index));
        }
      }
    }

    if(!node->targetPath.empty())
    {
      fragments.push_back(node->targetPath);
    }

    if(node->valueType != ValueType::eNone)
    {
      descriptor.valueType = node->valueType;
    }
  }

  if(descriptor.valueType == ValueType::eNone)
  {
    return invalid("not an animatable property");
  }

  descriptor.targetPath = fmt::format("{}", fmt::join(fragments, "."));
  return std::nullopt;
}

}  // namespace propanim
