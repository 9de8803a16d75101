// Copyright 2022 Aeva Palecek
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

#include <algorithm>
#include <thread>
#include <vector>

#include "threadpool.h"


int PoolSize(int JobCount)
{
	static const int HardwareThreads = std::max(int(std::thread::hardware_concurrency()), 2);
	return std::clamp(JobCount, 1, HardwareThreads);
}


void Pool(const std::function<void()>& Thunk, int JobCount)
{
	const int ThreadCount = PoolSize(JobCount);
	if (ThreadCount == 1)
	{
		Thunk();
		return;
	}
	std::vector<std::thread> Threads;
	Threads.reserve(ThreadCount);
	for (int i = 0; i < ThreadCount; ++i)
	{
		Threads.emplace_back(Thunk);
	}
	for (auto& Thread : Threads)
	{
		Thread.join();
	}
}
