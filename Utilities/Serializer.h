#pragma once
#include "pch.h"
#include <type_traits>
#include "Utilities/ISerializable.h"

/// <summary>Output format for a Serializer</summary>
enum class SerializeFormat {
	/// <summary>Key/value binary records, can be saved and loaded</summary>
	Binary,

	/// <summary>Human-readable "key = value" dump, save only</summary>
	Text,
};

/// <summary>
/// Key/value state serializer used for save states.
/// </summary>
/// <remarks>
/// Binary layout:
///   [version:4][payloadSize:4] followed by records of
///   [key bytes][0][size:4][value bytes]
///
/// Values are copied in host byte order. Keys are built from the current
/// name prefix stack plus the member name (see SV()), so a nested
/// ISerializable member produces keys such as "rx.SampleCounter".
///
/// Loading is tolerant: a key absent from the stream leaves the target
/// value untouched and is counted by GetMissingKeyCount(). Bools are
/// normalized, other values are loaded as-is: range checks belong to each
/// Serialize() implementation.
/// </remarks>
class Serializer {
private:
	struct RecordInfo {
		uint32_t Offset;
		uint32_t Size;
	};

	static constexpr uint32_t MaxReadChunk = 0x10000;

	uint32_t _version = 0;
	bool _saving = false;
	SerializeFormat _format = SerializeFormat::Binary;

	vector<uint8_t> _data;
	stringstream _text;
	std::unordered_map<string, RecordInfo> _records;
	uint32_t _missingKeyCount = 0;

	vector<string> _prefixes;
	string _prefix;

	static string CleanName(const char* name);
	string GetKey(const char* name);
	void UpdatePrefix();

	void WriteRecord(const string& key, const void* src, uint32_t size);
	bool ReadRecord(const string& key, void* dst, uint32_t size);

	template<typename T>
	static void WriteTextValue(stringstream& out, const T& value) {
		if constexpr (std::is_same_v<T, bool>) {
			out << (value ? "true" : "false");
		} else if constexpr (std::is_enum_v<T>) {
			out << static_cast<int64_t>(value);
		} else if constexpr (sizeof(T) == 1) {
			out << static_cast<int32_t>(value);
		} else {
			out << value;
		}
	}

public:
	Serializer(uint32_t version, bool forSave, SerializeFormat format = SerializeFormat::Binary);

	[[nodiscard]] uint32_t GetVersion() const { return _version; }
	[[nodiscard]] bool IsSaving() const { return _saving; }
	[[nodiscard]] uint32_t GetMissingKeyCount() const { return _missingKeyCount; }

	template<typename T>
	void Stream(T& value, const char* name) {
		if constexpr (std::is_base_of_v<ISerializable, T>) {
			PushNamePrefix(name);
			value.Serialize(*this);
			PopNamePrefix();
		} else {
			static_assert(std::is_arithmetic_v<T> || std::is_enum_v<T>, "Stream() only supports scalar values and ISerializable objects");
			string key = GetKey(name);
			if (_saving) {
				if (_format == SerializeFormat::Text) {
					_text << key << " = ";
					WriteTextValue(_text, value);
					_text << "\n";
				} else {
					WriteRecord(key, &value, sizeof(T));
				}
			} else if constexpr (std::is_same_v<T, bool>) {
				// Any nonzero byte loads as true, never as an invalid bool representation
				uint8_t raw = value ? 1 : 0;
				if (ReadRecord(key, &raw, sizeof(raw))) {
					value = raw != 0;
				}
			} else {
				ReadRecord(key, &value, sizeof(T));
			}
		}
	}

	template<typename T>
	void StreamArray(T* values, uint32_t count, const char* name) {
		static_assert(std::is_arithmetic_v<T> || std::is_enum_v<T>, "StreamArray() only supports scalar arrays");
		string key = GetKey(name);
		if (_saving) {
			if (_format == SerializeFormat::Text) {
				_text << key << " = [";
				for (uint32_t i = 0; i < count; i++) {
					if (i > 0) {
						_text << ", ";
					}
					WriteTextValue(_text, values[i]);
				}
				_text << "]\n";
			} else {
				WriteRecord(key, values, static_cast<uint32_t>(sizeof(T) * count));
			}
		} else {
			ReadRecord(key, values, static_cast<uint32_t>(sizeof(T) * count));
		}
	}

	void PushNamePrefix(const char* name);
	void PopNamePrefix();

	/// <summary>Write the serialized state to a stream. Only valid for a saving serializer.</summary>
	bool SaveTo(ostream& out);

	/// <summary>
	/// Parse a binary state stream so Stream() calls can read from it.
	/// </summary>
	/// <returns>False for text format, truncated/malformed data, or a stream written by a newer version</returns>
	bool LoadFrom(istream& in);
};

#define SV(var) (s.Stream(var, #var))
#define SVArray(arr, count) (s.StreamArray(arr, count, #arr))
