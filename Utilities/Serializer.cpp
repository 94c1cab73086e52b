#include "pch.h"
#include "Utilities/Serializer.h"

Serializer::Serializer(uint32_t version, bool forSave, SerializeFormat format) {
	_version = version;
	_saving = forSave;
	_format = format;
}

string Serializer::CleanName(const char* name) {
	string cleaned = name;
	if (cleaned.rfind("_state.", 0) == 0) {
		cleaned.erase(0, 7);
	} else if (!cleaned.empty() && cleaned[0] == '_') {
		cleaned.erase(0, 1);
	}
	return cleaned;
}

string Serializer::GetKey(const char* name) {
	if (_prefix.empty()) {
		return CleanName(name);
	}
	return _prefix + "." + CleanName(name);
}

void Serializer::UpdatePrefix() {
	_prefix.clear();
	for (size_t i = 0; i < _prefixes.size(); i++) {
		if (i > 0) {
			_prefix += ".";
		}
		_prefix += _prefixes[i];
	}
}

void Serializer::PushNamePrefix(const char* name) {
	_prefixes.push_back(CleanName(name));
	UpdatePrefix();
}

void Serializer::PopNamePrefix() {
	if (!_prefixes.empty()) {
		_prefixes.pop_back();
		UpdatePrefix();
	}
}

void Serializer::WriteRecord(const string& key, const void* src, uint32_t size) {
	size_t pos = _data.size();
	_data.resize(pos + key.size() + 1 + sizeof(uint32_t) + size);

	uint8_t* dst = _data.data() + pos;
	memcpy(dst, key.c_str(), key.size() + 1);
	dst += key.size() + 1;
	memcpy(dst, &size, sizeof(uint32_t));
	dst += sizeof(uint32_t);
	if (size > 0) {
		memcpy(dst, src, size);
	}
}

bool Serializer::ReadRecord(const string& key, void* dst, uint32_t size) {
	auto result = _records.find(key);
	if (result == _records.end() || result->second.Size != size) {
		_missingKeyCount++;
		return false;
	}
	if (size > 0) {
		memcpy(dst, _data.data() + result->second.Offset, size);
	}
	return true;
}

bool Serializer::SaveTo(ostream& out) {
	if (!_saving) {
		return false;
	}

	if (_format == SerializeFormat::Text) {
		out << _text.str();
		return out.good();
	}

	uint32_t payloadSize = static_cast<uint32_t>(_data.size());
	out.write(reinterpret_cast<const char*>(&_version), sizeof(uint32_t));
	out.write(reinterpret_cast<const char*>(&payloadSize), sizeof(uint32_t));
	if (payloadSize > 0) {
		out.write(reinterpret_cast<const char*>(_data.data()), payloadSize);
	}
	return out.good();
}

bool Serializer::LoadFrom(istream& in) {
	if (_saving || _format != SerializeFormat::Binary) {
		return false;
	}

	uint32_t fileVersion = 0;
	uint32_t payloadSize = 0;
	in.read(reinterpret_cast<char*>(&fileVersion), sizeof(uint32_t));
	in.read(reinterpret_cast<char*>(&payloadSize), sizeof(uint32_t));
	if (!in.good() || fileVersion > _version) {
		return false;
	}

	// The header size is not trusted: grow the buffer one chunk at a time so a
	// short stream fails before anything close to payloadSize is allocated
	_data.clear();
	uint32_t remaining = payloadSize;
	while (remaining > 0) {
		uint32_t chunkSize = std::min(remaining, MaxReadChunk);
		size_t offset = _data.size();
		_data.resize(offset + chunkSize);
		in.read(reinterpret_cast<char*>(_data.data() + offset), chunkSize);
		if (static_cast<uint32_t>(in.gcount()) != chunkSize) {
			_data.clear();
			return false;
		}
		remaining -= chunkSize;
	}

	_records.clear();
	uint32_t pos = 0;
	while (pos < payloadSize) {
		const uint8_t* start = _data.data() + pos;
		const void* terminator = memchr(start, 0, payloadSize - pos);
		if (terminator == nullptr) {
			_records.clear();
			return false;
		}

		uint32_t keyLength = static_cast<uint32_t>(static_cast<const uint8_t*>(terminator) - start);
		string key(reinterpret_cast<const char*>(start), keyLength);
		pos += keyLength + 1;

		uint32_t size = 0;
		if (payloadSize - pos < sizeof(uint32_t)) {
			_records.clear();
			return false;
		}
		memcpy(&size, _data.data() + pos, sizeof(uint32_t));
		pos += sizeof(uint32_t);

		if (payloadSize - pos < size) {
			_records.clear();
			return false;
		}
		_records[key] = {pos, size};
		pos += size;
	}

	// Older streams are accepted; Serialize() implementations can branch on GetVersion()
	_version = fileVersion;
	_missingKeyCount = 0;
	return true;
}
