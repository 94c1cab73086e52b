#include "pch.h"
#include "Utilities/HexUtilities.h"

constexpr char _hexDigits[16] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

string HexUtilities::ToHex(uint8_t value) {
	string result(2, '0');
	result[0] = _hexDigits[value >> 4];
	result[1] = _hexDigits[value & 0x0F];
	return result;
}

string HexUtilities::ToBinary(uint8_t value) {
	string result(8, '0');
	for (int i = 0; i < 8; i++) {
		if (value & (0x80 >> i)) {
			result[i] = '1';
		}
	}
	return result;
}
