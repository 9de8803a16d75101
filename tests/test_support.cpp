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
#include <string>
#include <thread>
#include <vector>
#include <catch2/catch.hpp>
#include "aabb.h"
#include "errors.h"
#include "profiling.h"
#include "threadpool.h"


using namespace glm;


TEST_CASE("Pool", "[Support]")
{
	CHECK(PoolSize(1000) >= 2);
	CHECK(PoolSize(1) == 1);
	CHECK(PoolSize(0) == 1);
	CHECK(PoolSize(2) == 2);

	const int ItemCount = 1000;
	std::vector<int> Visits(ItemCount, 0);
	std::atomic_int NextItem(0);
	std::atomic_int Workers(0);
	Pool([&]()
	{
		++Workers;
		while (true)
		{
			const int Item = NextItem.fetch_add(1);
			if (Item >= ItemCount)
			{
				break;
			}
			++Visits[Item];
		}
	}, ItemCount);

	CHECK(Workers.load() == PoolSize(ItemCount));
	for (const int Count : Visits)
	{
		CHECK(Count == 1);
	}

	SECTION("A single job runs on the calling thread")
	{
		std::thread::id Runner;
		Pool([&]()
		{
			Runner = std::this_thread::get_id();
		}, 1);
		CHECK(Runner == std::this_thread::get_id());
	}
}


TEST_CASE("Stopwatch", "[Support]")
{
	Stopwatch Timer;
	{
		ProfileScope Scope("Stopwatch test");
	}
	const double First = Timer.ElapsedMillis();
	const double Second = Timer.ElapsedMillis();
	CHECK(First >= 0.0);
	CHECK(Second >= First);

	Timer.Start();
	CHECK(Timer.ElapsedMillis() <= Second + 1000.0);
}


TEST_CASE("AABB", "[Support]")
{
	AABB Bounds = AABB::Empty();
	CHECK(Bounds.Degenerate());
	CHECK(Bounds.Volume() == 0.0);

	Bounds.Extend(dvec3(-1.0, 0.0, 2.0));
	CHECK_FALSE(Bounds.Degenerate());
	Bounds.Extend(dvec3(1.0, 4.0, 3.0));

	CHECK(Bounds.Extent() == dvec3(2.0, 4.0, 1.0));
	CHECK(Bounds.Center() == dvec3(0.0, 2.0, 2.5));
	CHECK(Bounds.Volume() == 8.0);
	CHECK(Bounds.Contains(dvec3(0.0, 1.0, 2.5)));
	CHECK(Bounds.Contains(dvec3(1.0, 4.0, 3.0)));
	CHECK_FALSE(Bounds.Contains(dvec3(0.0, 5.0, 2.5)));

	const AABB Padded = Bounds + 0.5;
	CHECK(Padded.Contains(Bounds));
	CHECK_FALSE(Bounds.Contains(Padded));
	CHECK(Padded.Min == dvec3(-1.5, -0.5, 1.5));
	CHECK((Bounds + dvec3(1.0, 0.0, 0.0)).Max == dvec3(2.0, 4.0, 3.0));

	for (const dvec3& Corner : Bounds.Corners())
	{
		CHECK(Bounds.Contains(Corner));
	}
}


TEST_CASE("StatusName", "[Support]")
{
	CHECK(std::string(StatusName(StatusCode::PASS)) == "PASS");
	CHECK(std::string(StatusName(StatusCode::INVALID_SHAPE_CONFIGURATION)) == "INVALID_SHAPE_CONFIGURATION");
	CHECK(std::string(StatusName(StatusCode::INVALID_GRID_CONFIGURATION)) == "INVALID_GRID_CONFIGURATION");
}
