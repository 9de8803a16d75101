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

#include <type_traits>
#include <variant>
#include <fmt/format.h>
#include "isosurface.h"
#include "profiling.h"


using namespace glm;


IsosurfaceSettings ClampSettings(const IsosurfaceSettings& Settings)
{
	IsosurfaceSettings Clamped = Settings;

	std::visit([](auto& Params)
	{
		using ParamsT = std::decay_t<decltype(Params)>;
		if constexpr (std::is_same_v<ParamsT, SphereParams>)
		{
			Params.Radius = max(Params.Radius, 0.0);
		}
		else if constexpr (std::is_same_v<ParamsT, BoxParams>)
		{
			Params.Width = max(Params.Width, 0.0);
			Params.Height = max(Params.Height, 0.0);
			Params.Depth = max(Params.Depth, 0.0);
		}
		else if constexpr (std::is_same_v<ParamsT, TorusParams>)
		{
			Params.MajorRadius = max(Params.MajorRadius, 0.0);
			Params.MinorRadius = max(Params.MinorRadius, 0.0);
		}
		else if constexpr (std::is_same_v<ParamsT, ConeParams>)
		{
			Params.Radius = max(Params.Radius, 0.0);
			Params.Height = max(Params.Height, 0.0);
		}
	}, Clamped.Params);

	Clamped.Scale = max(Clamped.Scale, dvec3(0.001));
	Clamped.VoxelSize = clamp(Clamped.VoxelSize, 0.025f, 0.25f);
	Clamped.DegenerateThreshold = clamp(Clamped.DegenerateThreshold, 0.0f, 1.0f);
	return Clamped;
}


size_t CountDegenerateTriangles(const Mesh& Target, float VoxelSize, float Threshold)
{
	const float Limit = VoxelSize * Threshold;
	size_t Count = 0;
	Target.WalkTriangles([&](const Mesh::TriangleT& Triangle)
	{
		const float Shortest = min(
			distance(Triangle[0], Triangle[1]),
			distance(Triangle[1], Triangle[2]),
			distance(Triangle[2], Triangle[0]));
		if (Shortest <= Limit)
		{
			++Count;
		}
	});
	return Count;
}


StatusCode IsosurfacePipeline::UpdateVoxelGrid(const IsosurfaceSettings& Settings)
{
	RETURN_ON_FAIL(ApplySettings(Settings));

	Grid.FitToShape(CurrentShape);

	Stopwatch Timer;
	Grid.Voxelize(CurrentShape);
	CurrentStats.VoxelizeMillis = Timer.ElapsedMillis();

	return UpdateMesh(Settings);
}


StatusCode IsosurfacePipeline::UpdateMesh(const IsosurfaceSettings& Settings)
{
	Stopwatch Timer;
	const StatusCode Result = BuildMesh(Settings.Mesher, Grid, Settings.IsoLevel, Settings.SmoothShading, Surface);
	if (FAILED(Result))
	{
		fmt::print("Rejected invalid mesher.\n");
		return Result;
	}
	CurrentStats.MeshMillis = Timer.ElapsedMillis();

	CurrentStats.VoxelSize = Grid.GetVoxelSize();
	CurrentStats.Dimensions = Grid.GetDimensions();
	CurrentStats.VertexCount = Surface.VertexCount();
	CurrentStats.TriangleCount = Surface.TriangleCount();
	CurrentStats.DegenerateCount = CountDegenerateTriangles(Surface, Grid.GetVoxelSize(), Settings.DegenerateThreshold);

	return StatusCode::PASS;
}


void IsosurfacePipeline::SetSmoothShading(bool SmoothShading)
{
	Surface.SetSmoothShading(SmoothShading);
}


StatusCode IsosurfacePipeline::ApplySettings(const IsosurfaceSettings& Settings)
{
	// Nothing is committed until every setting has been accepted.
	if (!VoxelGrid::ValidVoxelSize(Settings.VoxelSize))
	{
		fmt::print("Rejected voxel size {}: {}\n", Settings.VoxelSize, StatusName(StatusCode::INVALID_GRID_CONFIGURATION));
		return StatusCode::INVALID_GRID_CONFIGURATION;
	}

	// Leaves the previous transform in place on failure.
	StatusCode Result = CurrentShape.SetTransform(Settings.Scale, Settings.RotationDegrees, Settings.Translation);
	if (FAILED(Result))
	{
		fmt::print("Rejected transform with scale ({}, {}, {}): {}\n",
			Settings.Scale.x, Settings.Scale.y, Settings.Scale.z, StatusName(Result));
		return Result;
	}

	CurrentShape.SetParams(Settings.Params);
	return Grid.SetVoxelSize(Settings.VoxelSize);
}
