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

/*-------------------------------------------------------------------------------------------------
# namespace `tinygltf::utils`
> Helpers to read extension objects out of tinygltf's representation of glTF.
-------------------------------------------------------------------------------------------------*/

#include <cmath>
#include <limits>
#include <optional>
#include <string>

#include <tinygltf/tiny_gltf.h>

#define KHR_LIGHTS_PUNCTUAL_EXTENSION_NAME "KHR_lights_punctual"
#define KHR_TEXTURE_TRANSFORM_EXTENSION_NAME "KHR_texture_transform"

namespace tinygltf::utils {

/*-------------------------------------------------------------------------------------------------
## Function `hasElementName<MapType>`
> Check if the map has the specified element.

Can be used for extensions, extras, or any other map.
-------------------------------------------------------------------------------------------------*/
template <typename MapType>
bool hasElementName(const MapType& map, const std::string& key)
{
  return map.find(key) != map.end();
}

/*-------------------------------------------------------------------------------------------------
## Function `getElementValue<MapType>`
> Get the value of the specified element from the map. The element must exist.
-------------------------------------------------------------------------------------------------*/
template <typename MapType>
const typename MapType::mapped_type& getElementValue(const MapType& map, const std::string& key)
{
  return map.at(key);
}

/*-------------------------------------------------------------------------------------------------
## Function `getInt`
> Returns the integer member `name` of a JSON object value.

Returns nothing if the member is absent or not an integer in `int` range. Whole-valued reals are accepted,
as some exporters write indices as `1.0`.
-------------------------------------------------------------------------------------------------*/
inline std::optional<int> getInt(const tinygltf::Value& value, const std::string& name)
{
  if(!value.IsObject() || !value.Has(name))
    return std::nullopt;

  const tinygltf::Value& member = value.Get(name);
  if(member.IsInt())
    return member.Get<int>();
  if(member.IsReal())
  {
    const double d = member.Get<double>();
    if(d >= static_cast<double>(std::numeric_limits<int>::min()) && d <= static_cast<double>(std::numeric_limits<int>::max())
       && d == std::trunc(d))
      return static_cast<int>(d);
  }
  return std::nullopt;
}

/*-------------------------------------------------------------------------------------------------
## Function `getString`
> Returns the string member `name` of a JSON object value, or nothing.
-------------------------------------------------------------------------------------------------*/
inline std::optional<std::string> getString(const tinygltf::Value& value, const std::string& name)
{
  if(!value.IsObject() || !value.Has(name) || !value.Get(name).IsString())
    return std::nullopt;
  return value.Get(name).Get<std::string>();
}

}  // namespace tinygltf::utils
