/*
 * 설명: 엔진들이 공유하는 시각 타입과 주입 가능한 시계.
 * 버전: v1.0.0
 */
#pragma once

#include <chrono>
#include <functional>

namespace jts {

using TimePoint = std::chrono::system_clock::time_point;

// 비어 있으면 system_clock::now()를 쓴다.
using Clock = std::function<TimePoint()>;

inline TimePoint ReadClock(const Clock& clock) { return clock ? clock() : std::chrono::system_clock::now(); }

}  // namespace jts
