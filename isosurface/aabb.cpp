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

#include "aabb.h"
#include <limits>


AABB AABB::Empty()
{
	const double Huge = std::numeric_limits<double>::max();
	return {
		glm::dvec3(Huge),
		glm::dvec3(-Huge)
	};
}


bool AABB::Degenerate() const
{
	const bool AnyInf = glm::any(glm::isinf(Min)) || glm::any(glm::isinf(Max));
	const bool AnyNan = glm::any(glm::isnan(Min)) || glm::any(glm::isnan(Max));
	const bool NotWellFormed = glm::any(glm::lessThan(Max, Min));
	return AnyInf || AnyNan || NotWellFormed;
}


bool AABB::Contains(glm::dvec3 Point) const
{
	return \
		glm::all(glm::lessThanEqual(Min, Point)) &&
		glm::all(glm::lessThanEqual(Point, Max));
}


bool AABB::Contains(const AABB& Other) const
{
	if (Degenerate() || Other.Degenerate())
	{
		return false;
	}
	else
	{
		return Contains(Other.Min) && Contains(Other.Max);
	}
}


void AABB::Extend(glm::dvec3 Point)
{
	Min = glm::min(Min, Point);
	Max = glm::max(Max, Point);
}


std::array<glm::dvec3, 8> AABB::Corners() const
{
	// The order of the corners doesn't matter to any caller.
	return {
		glm::dvec3(Min.x, Min.y, Min.z),
		glm::dvec3(Max.x, Min.y, Min.z),
		glm::dvec3(Min.x, Max.y, Min.z),
		glm::dvec3(Max.x, Max.y, Min.z),
		glm::dvec3(Min.x, Min.y, Max.z),
		glm::dvec3(Max.x, Min.y, Max.z),
		glm::dvec3(Min.x, Max.y, Max.z),
		glm::dvec3(Max.x, Max.y, Max.z)
	};
}


glm::dvec3 AABB::Extent() const
{
	if (Degenerate())
	{
		return glm::dvec3(0.0, 0.0, 0.0);
	}
	else
	{
		return Max - Min;
	}
}


glm::dvec3 AABB::Center() const
{
	if (Degenerate())
	{
		return glm::dvec3(0.0, 0.0, 0.0);
	}
	else
	{
		return Extent() * glm::dvec3(0.5) + Min;
	}
}


double AABB::Volume() const
{
	if (Degenerate())
	{
		return 0.0;
	}
	else
	{
		const glm::dvec3 MyExtent = Extent();
		return MyExtent.x * MyExtent.y * MyExtent.z;
	}
}


AABB AABB::operator+(double Margin) const
{
	if (Degenerate())
	{
		glm::dvec3 Zeros = glm::dvec3(0.0);
		return { Zeros, Zeros };
	}
	else
	{
		return {
			Min - glm::dvec3(Margin),
			Max + glm::dvec3(Margin)
		};
	}
}


AABB AABB::operator+(glm::dvec3 Margin) const
{
	if (Degenerate())
	{
		glm::dvec3 Zeros = glm::dvec3(0.0);
		return { Zeros, Zeros };
	}
	else
	{
		return {
			Min - Margin,
			Max + Margin
		};
	}
}
