#pragma once
#include "pch.h"
#include "Uart/UartTypes.h"
#include "Utilities/ISerializable.h"

class UartSettings;

/// <summary>
/// 8-N-1 UART transmitter advanced by a once-per-bit-period tick enable.
///
///   Idle:  latches DataIn when the raw tx_enable line is low. Not gated by
///          BitTick: a frame can be requested on any clock.
///   Start: next BitTick drives the start bit (low)
///   Data:  each BitTick drives one buffered bit, LSB first
///   Stop:  next BitTick drives the stop bit (high) and returns to Idle
///
/// There is no queue. Requests made while busy are ignored, and the latched
/// byte is not affected by later changes to DataIn.
/// </summary>
class UartTransmitter final : public ISerializable {
private:
	UartSettings* _settings = nullptr;
	UartTxState _state = {};

	void RecoverInvalidPhase();

public:
	explicit UartTransmitter(UartSettings* settings = nullptr);

	/// <summary>Return to Idle with the line high and counters cleared</summary>
	void Reset();

	/// <summary>Evaluate one system clock</summary>
	UartTxOutputs Tick(const UartTxInputs& inputs);

	[[nodiscard]] bool GetSerialOut() const { return _state.Line; }
	[[nodiscard]] bool IsBusy() const { return _state.Phase != UartTxPhase::Idle; }
	[[nodiscard]] UartTxPhase GetPhase() const { return _state.Phase; }

	/// <summary>Get internal state for debugger</summary>
	[[nodiscard]] UartTxState& GetState() { return _state; }

	void Serialize(Serializer& s) override;
};
