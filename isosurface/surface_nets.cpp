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

// Surface nets as described in S.F. Gibson "Constrained Elastic Surface Nets" (1998)
// MERL Tech Report, without the relaxation step.  Every cell that the surface passes through
// gets one vertex at the average of its edge crossings, and every crossed edge becomes a quad
// joining the four cells that share it.

#include <array>
#include <vector>
#include "mesh_builder.h"


using namespace glm;


struct CellAccumulator
{
	// Cells are indexed by their minimum corner voxel, which ranges over [-2, Dimensions).
	static constexpr int Offset = 2;

	ivec3 Size;
	std::vector<vec4> Cells;

	CellAccumulator(ivec3 Dimensions)
		: Size(Dimensions + ivec3(Offset))
		, Cells(size_t(Size.x) * size_t(Size.y) * size_t(Size.z), vec4(0.0f))
	{
	}

	size_t Index(ivec3 Cell) const
	{
		const ivec3 Local = Cell + ivec3(Offset);
		return size_t(Local.x) + size_t(Local.y) * size_t(Size.x) + size_t(Local.z) * size_t(Size.x) * size_t(Size.y);
	}

	void Add(ivec3 Cell, vec3 Point)
	{
		Cells[Index(Cell)] += vec4(Point, 1.0f);
	}

	// Replaces each accumulated sum with the average of its points.
	void Resolve()
	{
		for (vec4& Cell : Cells)
		{
			if (Cell.w > 0.0f)
			{
				Cell = vec4(vec3(Cell) * (1.0f / Cell.w), Cell.w);
			}
		}
	}

	vec3 Vertex(ivec3 Cell) const
	{
		return vec3(Cells[Index(Cell)]);
	}
};


struct EdgeAxis
{
	ivec3 Step;

	// The four cells sharing the edge, counter-clockwise around the positive axis.
	std::array<ivec3, 4> Cells;
};


static const std::array<EdgeAxis, 3> EdgeAxes =
{{
	{ ivec3(1, 0, 0), {{ ivec3(0, -1, -1), ivec3(0, 0, -1), ivec3(0, 0, 0), ivec3(0, -1, 0) }} },
	{ ivec3(0, 1, 0), {{ ivec3(-1, 0, -1), ivec3(-1, 0, 0), ivec3(0, 0, 0), ivec3(0, 0, -1) }} },
	{ ivec3(0, 0, 1), {{ ivec3(-1, -1, 0), ivec3(0, -1, 0), ivec3(0, 0, 0), ivec3(-1, 0, 0) }} }
}};


template<typename EdgeThunk>
static void WalkCrossedEdges(const VoxelGrid& Grid, float IsoLevel, EdgeThunk& Thunk)
{
	for (int Z = -1; Z < Grid.GetDepth(); ++Z)
	{
		for (int Y = -1; Y < Grid.GetHeight(); ++Y)
		{
			for (int X = -1; X < Grid.GetWidth(); ++X)
			{
				const ivec3 Start = ivec3(X, Y, Z);
				const float StartDist = Grid.GetVoxel(Start);
				const bool StartInside = StartDist < IsoLevel;

				for (const EdgeAxis& Axis : EdgeAxes)
				{
					const ivec3 End = Start + Axis.Step;
					const float EndDist = Grid.GetVoxel(End);
					if (StartInside != (EndDist < IsoLevel))
					{
						Thunk(Start, End, StartDist, EndDist, StartInside, Axis);
					}
				}
			}
		}
	}
}


void Meshing::SurfaceNets(const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh)
{
	MeshWriter Writer(OutMesh, SmoothShading);
	CellAccumulator Accumulator(Grid.GetDimensions());

	{
		auto Accumulate = [&](ivec3 Start, ivec3 End, float StartDist, float EndDist, bool StartInside, const EdgeAxis& Axis)
		{
			const vec3 Crossing = EdgeIntersection(IsoLevel, Grid.GetVoxelCenterPos(Start), Grid.GetVoxelCenterPos(End), StartDist, EndDist);
			for (const ivec3& Cell : Axis.Cells)
			{
				Accumulator.Add(Start + Cell, Crossing);
			}
		};
		WalkCrossedEdges(Grid, IsoLevel, Accumulate);
	}

	Accumulator.Resolve();

	{
		auto Connect = [&](ivec3 Start, ivec3 End, float StartDist, float EndDist, bool StartInside, const EdgeAxis& Axis)
		{
			const vec3 V0 = Accumulator.Vertex(Start + Axis.Cells[0]);
			const vec3 V1 = Accumulator.Vertex(Start + Axis.Cells[1]);
			const vec3 V2 = Accumulator.Vertex(Start + Axis.Cells[2]);
			const vec3 V3 = Accumulator.Vertex(Start + Axis.Cells[3]);

			// Face away from the inside end of the edge.
			if (StartInside)
			{
				Writer.Quad(V0, V1, V2, V3);
			}
			else
			{
				Writer.Quad(V0, V3, V2, V1);
			}
		};
		WalkCrossedEdges(Grid, IsoLevel, Connect);
	}
}
