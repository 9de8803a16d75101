// Copyright 2023 Aeva Palecek
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "glm_common.h"
#include <array>


struct AABB
{
	glm::dvec3 Min;
	glm::dvec3 Max;

	// Returns an inverted box that any call to Extend will replace.
	static AABB Empty();

	// A box with zero extent on some axis (a point or a flat shape) is still well formed.
	bool Degenerate() const;

	// Returns true if the point is within the AABB, boundary included.
	bool Contains(glm::dvec3 Point) const;

	// Returns true if the other AABB is fully within this one.
	bool Contains(const AABB& Other) const;

	void Extend(glm::dvec3 Point);

	std::array<glm::dvec3, 8> Corners() const;

	glm::dvec3 Extent() const;

	glm::dvec3 Center() const;

	double Volume() const;

	AABB operator+(double Margin) const;

	AABB operator+(glm::dvec3 Margin) const;
};
