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

#include "profiling.h"

#if ENABLE_PROFILING
#include <string>
#include <vector>
#include <fmt/format.h>

struct ProfilingEvent
{
	std::string Name;
	ProfilingTimePoint Start;
};

static thread_local std::vector<ProfilingEvent> EventStack;
#endif


void BeginEvent(const char* EventName)
{
#if ENABLE_PROFILING
	EventStack.push_back({ std::string(EventName), ProfilingClock::now() });
#endif
}


void EndEvent()
{
#if ENABLE_PROFILING
	if (!EventStack.empty())
	{
		const ProfilingEvent& Event = EventStack.back();
		const std::chrono::duration<double, std::milli> Delta = ProfilingClock::now() - Event.Start;
		fmt::print("[profile] {:{}}{}: {:.3f} ms\n", "", (EventStack.size() - 1) * 2, Event.Name, Delta.count());
		EventStack.pop_back();
	}
#endif
}


ProfileScope::ProfileScope(const char* EventName)
{
	BeginEvent(EventName);
}


ProfileScope::~ProfileScope()
{
	EndEvent();
}


Stopwatch::Stopwatch()
{
	Start();
}


void Stopwatch::Start()
{
	StartTime = ProfilingClock::now();
}


double Stopwatch::ElapsedMillis() const
{
	const std::chrono::duration<double, std::milli> Delta = ProfilingClock::now() - StartTime;
	return Delta.count();
}
