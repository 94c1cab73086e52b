#pragma once
#include "pch.h"

/// <summary>
/// Formatting helpers for byte values in log messages.
/// </summary>
class HexUtilities {
public:
	/// <summary>
	/// Converts an 8-bit value to a 2-character uppercase hex string.
	/// </summary>
	/// <param name="value">8-bit unsigned integer (0-255)</param>
	/// <returns>2-character hex string (e.g., "0A", "FF")</returns>
	static string ToHex(uint8_t value);

	/// <summary>
	/// Converts an 8-bit value to its 8-character binary form, MSB first.
	/// </summary>
	/// <remarks>Note that the serial line carries the LSB first, so the string reads in reverse wire order.</remarks>
	static string ToBinary(uint8_t value);
};
