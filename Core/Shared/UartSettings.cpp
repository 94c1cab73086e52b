#include "pch.h"
#include "Shared/UartSettings.h"
#include "Utilities/Serializer.h"

UartSettings::UartSettings() : _flags(0) {
}

void UartSettings::SetLinkConfig(const UartLinkConfig& config) {
	auto lock = _lock.AcquireSafe();
	_link = config;
	if (_link.ClocksPerSample == 0) {
		_link.ClocksPerSample = 1;
	}
}

UartLinkConfig UartSettings::GetLinkConfig() {
	auto lock = _lock.AcquireSafe();
	return _link;
}

void UartSettings::SetFlag(UartFlags flag) {
	_flags.fetch_or(static_cast<uint32_t>(flag));
}

void UartSettings::SetFlagState(UartFlags flag, bool enabled) {
	if (enabled) {
		SetFlag(flag);
	} else {
		ClearFlag(flag);
	}
}

void UartSettings::ClearFlag(UartFlags flag) {
	_flags.fetch_and(~static_cast<uint32_t>(flag));
}

bool UartSettings::CheckFlag(UartFlags flag) const {
	return (_flags.load() & static_cast<uint32_t>(flag)) != 0;
}

void UartSettings::Serialize(Serializer& s) {
	auto lock = _lock.AcquireSafe();

	uint32_t flags = _flags.load();
	SV(flags);
	SV(_link.ClocksPerSample);
	SV(_link.RxEnabled);

	if (!s.IsSaving()) {
		_flags = flags;
		if (_link.ClocksPerSample == 0) {
			_link.ClocksPerSample = 1;
		}
	}
}
