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

#include <atomic>
#include <cmath>
#include "voxel_grid.h"
#include "threadpool.h"
#include "profiling.h"


using namespace glm;


size_t NextPowerOfTwo(size_t Value)
{
	if (Value == 0)
	{
		return 1;
	}
	--Value;
	for (size_t Shift = 1; Shift < sizeof(size_t) * 8; Shift <<= 1)
	{
		Value |= Value >> Shift;
	}
	return Value + 1;
}


VoxelGrid::VoxelGrid()
	: VoxelSize(DefaultVoxelSize)
	, Origin(0.0f)
	, Dimensions(0)
{
}


bool VoxelGrid::ValidVoxelSize(float VoxelSize)
{
	return VoxelSize > 0.0f && !std::isinf(VoxelSize);
}


StatusCode VoxelGrid::SetVoxelSize(float NewVoxelSize)
{
	if (!ValidVoxelSize(NewVoxelSize))
	{
		return StatusCode::INVALID_GRID_CONFIGURATION;
	}
	VoxelSize = NewVoxelSize;
	return StatusCode::PASS;
}


size_t VoxelGrid::VoxelCount() const
{
	return size_t(Dimensions.x) * size_t(Dimensions.y) * size_t(Dimensions.z);
}


void VoxelGrid::FitToShape(const Shape& Target)
{
	const AABB Bounds = Target.WorldBounds();
	const dvec3 Extent = Bounds.Extent();
	const double Size = double(VoxelSize);

	const dvec3 Low = (floor(Bounds.Min / Size) - 1.0) * Size;
	Origin = vec3(Low);
	Dimensions = ivec3(ceil(Extent / Size)) + 2;

	// The stored origin may land up to a voxel below the bounds, which can eat into the
	// padding on the high side.  Add a layer wherever that happens.
	for (int Axis = 0; Axis < 3; ++Axis)
	{
		const double High = double(Origin[Axis]) + double(Dimensions[Axis]) * Size;
		if (High < Bounds.Max[Axis] + Size)
		{
			++Dimensions[Axis];
		}
	}

	const size_t Required = VoxelCount();
	if (Required > Voxels.size())
	{
		Voxels.resize(NextPowerOfTwo(Required));
	}
}


void VoxelGrid::Voxelize(const Shape& Target)
{
	ProfileScope Scope("VoxelGrid::Voxelize");

	// Every slice is written by exactly one worker, so the result does not depend on scheduling.
	std::atomic_int NextSlice(0);
	const int SliceCount = Dimensions.z;
	Pool([&]()
	{
		while (true)
		{
			const int Z = NextSlice.fetch_add(1);
			if (Z >= SliceCount)
			{
				break;
			}
			for (int Y = 0; Y < Dimensions.y; ++Y)
			{
				for (int X = 0; X < Dimensions.x; ++X)
				{
					const vec3 Center = GetVoxelCenterPos(X, Y, Z);
					Voxels[Index(X, Y, Z)] = float(Target.WorldDistance(dvec3(Center)));
				}
			}
		}
	}, SliceCount);
}


bool VoxelGrid::InBounds(int X, int Y, int Z) const
{
	return \
		X >= 0 && X < Dimensions.x &&
		Y >= 0 && Y < Dimensions.y &&
		Z >= 0 && Z < Dimensions.z;
}


float VoxelGrid::GetVoxel(int X, int Y, int Z) const
{
	if (InBounds(X, Y, Z))
	{
		return Voxels[Index(X, Y, Z)];
	}
	else
	{
		return OutsideValue;
	}
}


float VoxelGrid::GetVoxel(ivec3 Coord) const
{
	return GetVoxel(Coord.x, Coord.y, Coord.z);
}


vec3 VoxelGrid::GetVoxelCornerPos(int X, int Y, int Z) const
{
	return vec3(
		float(X) * VoxelSize + Origin.x,
		float(Y) * VoxelSize + Origin.y,
		float(Z) * VoxelSize + Origin.z);
}


vec3 VoxelGrid::GetVoxelCornerPos(ivec3 Coord) const
{
	return GetVoxelCornerPos(Coord.x, Coord.y, Coord.z);
}


vec3 VoxelGrid::GetVoxelCenterPos(int X, int Y, int Z) const
{
	const float HalfVoxelSize = VoxelSize * 0.5f;
	return GetVoxelCornerPos(X, Y, Z) + vec3(HalfVoxelSize);
}


vec3 VoxelGrid::GetVoxelCenterPos(ivec3 Coord) const
{
	return GetVoxelCenterPos(Coord.x, Coord.y, Coord.z);
}


size_t VoxelGrid::Index(int X, int Y, int Z) const
{
	Assert(InBounds(X, Y, Z));
	return (size_t(Z) * size_t(Dimensions.y) + size_t(Y)) * size_t(Dimensions.x) + size_t(X);
}
