#pragma once
#include "pch.h"
#include "Uart/UartTypes.h"
#include "Uart/UartReceiver.h"
#include "Uart/UartTransmitter.h"
#include "Shared/SettingTypes.h"
#include "Utilities/ISerializable.h"

class UartSettings;

/// <summary>
/// Transmitter wired back into a receiver, with a prescaler standing in for
/// the external tick generator.
///
/// Timing base:
///   - one oversampling pulse every ClocksPerSample system clocks
///   - one transmitter bit tick on every 16th oversampling pulse
/// so both engines agree on the bit period.
///
/// Each clock, the receiver samples the line level the transmitter drove
/// before the clock edge (both engines behave as registers updated on the
/// same edge), then both engines tick.
/// </summary>
class UartLoopback final : public ISerializable {
private:
	static constexpr uint32_t SaveStateVersion = 1;

	UartSettings* _settings = nullptr;

	UartTransmitter _tx;
	UartReceiver _rx;

	uint64_t _clockCount = 0;

	/// <summary>System clocks since the last oversampling pulse</summary>
	uint32_t _prescaler = 0;

	/// <summary>Oversampling pulses since the last bit tick (0-15)</summary>
	uint8_t _sampleIndex = 0;

	uint8_t _pendingData = 0;
	bool _writePending = false;
	bool _ackPending = false;

	UartLinkConfig GetLinkConfig() const;
	void Clock(const UartLinkConfig& config);

public:
	explicit UartLoopback(UartSettings* settings = nullptr);

	/// <summary>Return both engines and the prescaler to power-on state</summary>
	void Reset();

	/// <summary>
	/// Request transmission of one byte. The transmitter latches it on the
	/// next clock.
	/// </summary>
	/// <returns>False (byte dropped) if the transmitter is busy or a request is already pending</returns>
	bool Write(uint8_t value);

	/// <summary>Advance the system clock</summary>
	void RunClocks(uint32_t count);

	/// <summary>Assert ready_ack on the next clock</summary>
	void Acknowledge();

	/// <summary>
	/// Take the received byte if one is ready, acknowledging it on the next clock.
	/// </summary>
	bool TryRead(uint8_t& value);

	/// <summary>
	/// Send one byte and run until the receiver commits a frame or one frame
	/// length plus alignment slack has elapsed.
	/// </summary>
	/// <returns>True if a byte was received (stored in received)</returns>
	bool Transfer(uint8_t value, uint8_t& received);

	/// <summary>Write engines, prescaler and pending requests as a binary save state</summary>
	bool SaveState(ostream& out);

	/// <summary>
	/// Restore a save state written by SaveState().
	/// </summary>
	/// <returns>
	/// InvalidFile for a truncated, malformed or newer stream (state untouched),
	/// SpecificError when some values were missing and kept their current contents
	/// </returns>
	DeserializeResult LoadState(istream& in);

	/// <summary>System clocks needed for one frame, including the wait for the first bit tick</summary>
	[[nodiscard]] uint32_t GetFrameTimeout() const;

	[[nodiscard]] uint64_t GetClockCount() const { return _clockCount; }
	[[nodiscard]] bool GetLineLevel() const { return _tx.GetSerialOut(); }

	[[nodiscard]] UartTransmitter& GetTransmitter() { return _tx; }
	[[nodiscard]] UartReceiver& GetReceiver() { return _rx; }

	void Serialize(Serializer& s) override;
};
