#pragma once
#include "pch.h"

/// <summary>Logging switches checked by the tick engines</summary>
enum class UartFlags : uint32_t {
	None = 0,

	/// <summary>Log every byte the receiver commits</summary>
	LogReceivedFrames = 1 << 0,

	/// <summary>Log every frame the transmitter finishes</summary>
	LogTransmittedFrames = 1 << 1,

	/// <summary>Log recovery from an out-of-range state value</summary>
	LogStateRecovery = 1 << 2,
};

/// <summary>
/// Timing used by the loopback harness in place of the external tick generator.
/// </summary>
struct UartLinkConfig {
	/// <summary>System clocks between oversampling pulses (1 = pulse every clock)</summary>
	uint32_t ClocksPerSample = 1;

	/// <summary>When false, the harness holds the receiver's inverted enable line asserted, so the receiver ignores the line</summary>
	bool RxEnabled = true;
};
