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

#include <cstdlib>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "isosurface.h"


using namespace glm;


static IsosurfaceSettings Settings;
static bool Verbose = false;


static dvec3 ReadVec3(const std::vector<std::string>& Args, size_t Cursor)
{
	return dvec3(
		atof(Args[Cursor].c_str()),
		atof(Args[Cursor + 1].c_str()),
		atof(Args[Cursor + 2].c_str()));
}


StatusCode Boot(int argc, char* argv[])
{
	std::vector<std::string> Args;
	for (int i = 1; i < argc; ++i)
	{
		Args.push_back(argv[i]);
	}

	ShapeKind Kind = ShapeKind::Sphere;
	SphereParams Sphere;
	BoxParams Box;
	TorusParams Torus;
	ConeParams Cone;
	{
		size_t Cursor = 0;
		while (Cursor < Args.size())
		{
			if (Args[Cursor] == "--shape" && (Cursor + 1) < Args.size())
			{
				Kind = ParseShapeKind(Args[Cursor + 1]);
				if (Kind == ShapeKind::Invalid)
				{
					fmt::print("Unknown shape \"{}\".\n", Args[Cursor + 1]);
					return StatusCode::FAIL;
				}
				Cursor += 2;
				continue;
			}
			else if (Args[Cursor] == "--radius" && (Cursor + 1) < Args.size())
			{
				Sphere.Radius = atof(Args[Cursor + 1].c_str());
				Cone.Radius = Sphere.Radius;
				Cursor += 2;
				continue;
			}
			else if (Args[Cursor] == "--size" && (Cursor + 3) < Args.size())
			{
				const dvec3 Size = ReadVec3(Args, Cursor + 1);
				Box.Width = Size.x;
				Box.Height = Size.y;
				Box.Depth = Size.z;
				Cursor += 4;
				continue;
			}
			else if (Args[Cursor] == "--torus" && (Cursor + 2) < Args.size())
			{
				Torus.MajorRadius = atof(Args[Cursor + 1].c_str());
				Torus.MinorRadius = atof(Args[Cursor + 2].c_str());
				Cursor += 3;
				continue;
			}
			else if (Args[Cursor] == "--cone" && (Cursor + 2) < Args.size())
			{
				Cone.Radius = atof(Args[Cursor + 1].c_str());
				Cone.Height = atof(Args[Cursor + 2].c_str());
				Cursor += 3;
				continue;
			}
			else if (Args[Cursor] == "--translate" && (Cursor + 3) < Args.size())
			{
				Settings.Translation = ReadVec3(Args, Cursor + 1);
				Cursor += 4;
				continue;
			}
			else if (Args[Cursor] == "--rotate" && (Cursor + 3) < Args.size())
			{
				Settings.RotationDegrees = ReadVec3(Args, Cursor + 1);
				Cursor += 4;
				continue;
			}
			else if (Args[Cursor] == "--scale" && (Cursor + 3) < Args.size())
			{
				Settings.Scale = ReadVec3(Args, Cursor + 1);
				Cursor += 4;
				continue;
			}
			else if (Args[Cursor] == "--voxel-size" && (Cursor + 1) < Args.size())
			{
				Settings.VoxelSize = float(atof(Args[Cursor + 1].c_str()));
				Cursor += 2;
				continue;
			}
			else if (Args[Cursor] == "--iso" && (Cursor + 1) < Args.size())
			{
				Settings.IsoLevel = float(atof(Args[Cursor + 1].c_str()));
				Cursor += 2;
				continue;
			}
			else if (Args[Cursor] == "--mesher" && (Cursor + 1) < Args.size())
			{
				Settings.Mesher = ParseMesherKind(Args[Cursor + 1]);
				if (Settings.Mesher == MesherKind::Invalid)
				{
					fmt::print("Unknown mesher \"{}\".\n", Args[Cursor + 1]);
					return StatusCode::FAIL;
				}
				Cursor += 2;
				continue;
			}
			else if (Args[Cursor] == "--flat")
			{
				Settings.SmoothShading = false;
				Cursor += 1;
				continue;
			}
			else if (Args[Cursor] == "--degenerate-threshold" && (Cursor + 1) < Args.size())
			{
				Settings.DegenerateThreshold = float(atof(Args[Cursor + 1].c_str()));
				Cursor += 2;
				continue;
			}
			else if (Args[Cursor] == "--verbose")
			{
				Verbose = true;
				Cursor += 1;
				continue;
			}
			else
			{
				fmt::print("Invalid commandline arg(s).\n");
				return StatusCode::FAIL;
			}
		}
	}

	switch (Kind)
	{
	case ShapeKind::Sphere:
		Settings.Params = Sphere;
		break;
	case ShapeKind::Box:
		Settings.Params = Box;
		break;
	case ShapeKind::Torus:
		Settings.Params = Torus;
		break;
	case ShapeKind::Cone:
		Settings.Params = Cone;
		break;
	default:
		UNREACHABLE();
	}

	Settings = ClampSettings(Settings);
	return StatusCode::PASS;
}


int main(int argc, char* argv[])
{
	if (FAILED(Boot(argc, argv)))
	{
		return 1;
	}

	if (Verbose)
	{
		fmt::print("Shape: {}\n", ShapeKindName(ShapeKind(Settings.Params.index())));
		fmt::print("Translation: ({}, {}, {})\n", Settings.Translation.x, Settings.Translation.y, Settings.Translation.z);
		fmt::print("Rotation: ({}, {}, {})\n", Settings.RotationDegrees.x, Settings.RotationDegrees.y, Settings.RotationDegrees.z);
		fmt::print("Scale: ({}, {}, {})\n", Settings.Scale.x, Settings.Scale.y, Settings.Scale.z);
		fmt::print("Mesher: {}\n", MesherKindName(Settings.Mesher));
		fmt::print("Iso level: {}\n", Settings.IsoLevel);
		fmt::print("Smooth shading: {}\n", Settings.SmoothShading);
	}

	IsosurfacePipeline Pipeline;
	const StatusCode Result = Pipeline.UpdateVoxelGrid(Settings);
	if (FAILED(Result))
	{
		fmt::print("Surface generation failed: {}\n", StatusName(Result));
		return 1;
	}

	const IsosurfaceStats& Stats = Pipeline.Stats();
	fmt::print("Voxel size: {:.3f}\n", Stats.VoxelSize);
	fmt::print("Grid dimensions: {} x {} x {}\n", Stats.Dimensions.x, Stats.Dimensions.y, Stats.Dimensions.z);
	fmt::print("Vertices: {}\n", Stats.VertexCount);
	fmt::print("Triangles: {}\n", Stats.TriangleCount);
	fmt::print("Degenerate triangles: {}\n", Stats.DegenerateCount);
	fmt::print("Voxelization time: {:.3f} ms\n", Stats.VoxelizeMillis);
	fmt::print("Surface generation time: {:.3f} ms\n", Stats.MeshMillis);
	return 0;
}
