#pragma once
#include "pch.h"
#include "Shared/SettingTypes.h"
#include "Utilities/SimpleLock.h"
#include "Utilities/ISerializable.h"

/// <summary>
/// Configuration for the UART engines and the loopback harness.
/// </summary>
/// <remarks>
/// Flag checks are lock-free (atomic) because the engines query them from
/// the tick path. Link config updates take a SimpleLock and are copied out,
/// so a caller never observes a half-written struct.
/// </remarks>
class UartSettings final : public ISerializable {
private:
	atomic<uint32_t> _flags;
	UartLinkConfig _link;
	SimpleLock _lock;

public:
	UartSettings();

	void SetLinkConfig(const UartLinkConfig& config);
	[[nodiscard]] UartLinkConfig GetLinkConfig();

	void SetFlag(UartFlags flag);
	void SetFlagState(UartFlags flag, bool enabled);
	void ClearFlag(UartFlags flag);
	[[nodiscard]] bool CheckFlag(UartFlags flag) const;

	void Serialize(Serializer& s) override;
};
