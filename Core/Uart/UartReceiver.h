#pragma once
#include "pch.h"
#include "Uart/UartTypes.h"
#include "Utilities/ISerializable.h"

class UartSettings;

/// <summary>
/// 8-N-1 UART receiver driven by a 16x oversampling tick enable.
///
/// Every call to Tick() is one system clock. The state machine only advances
/// on clocks where SampleTick is asserted and the receiver is active (raw
/// rx_enable line low). ReadyAck is honored on every clock.
///
/// Frame reception:
///   AwaitingStart: 15 consecutive low samples confirm a start bit and the
///                  next sample enters ReceivingData. A high sample before
///                  that restarts the count (short glitches are ignored).
///   ReceivingData: the free-running 0-15 sample counter captures each data
///                  bit (LSB first) at sample 8, the bit-period midpoint
///   CheckingStop:  accepts after a full period, or early once at least 8
///                  samples have elapsed and the line reads low again
///
/// No error is ever signaled. A bad stop bit is still accepted by the early
/// branch, and a byte completing before the previous one was acknowledged
/// silently replaces it (counted in Overruns for debugging only).
/// </summary>
class UartReceiver final : public ISerializable {
private:
	UartSettings* _settings = nullptr;
	UartRxState _state = {};

	void CommitFrame(bool earlyStop);
	void RecoverInvalidPhase();

public:
	explicit UartReceiver(UartSettings* settings = nullptr);

	/// <summary>Return all registers and counters to power-on values</summary>
	void Reset();

	/// <summary>Evaluate one system clock</summary>
	UartRxOutputs Tick(const UartRxInputs& inputs);

	[[nodiscard]] bool IsReady() const { return _state.Ready; }
	[[nodiscard]] uint8_t GetReceivedByte() const { return _state.ReceivedByte; }
	[[nodiscard]] UartRxPhase GetPhase() const { return _state.Phase; }

	/// <summary>Get internal state for debugger</summary>
	[[nodiscard]] UartRxState& GetState() { return _state; }

	void Serialize(Serializer& s) override;
};
