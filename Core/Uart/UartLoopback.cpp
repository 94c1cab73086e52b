#include "pch.h"
#include "Uart/UartLoopback.h"
#include "Shared/UartSettings.h"
#include "Shared/MessageManager.h"
#include "Utilities/HexUtilities.h"
#include "Utilities/Serializer.h"

UartLoopback::UartLoopback(UartSettings* settings)
	: _settings(settings), _tx(settings), _rx(settings) {
	Reset();
}

void UartLoopback::Reset() {
	_tx.Reset();
	_rx.Reset();
	_clockCount = 0;
	_prescaler = 0;
	_sampleIndex = 0;
	_pendingData = 0;
	_writePending = false;
	_ackPending = false;
}

UartLinkConfig UartLoopback::GetLinkConfig() const {
	if (_settings) {
		return _settings->GetLinkConfig();
	}
	return {};
}

bool UartLoopback::Write(uint8_t value) {
	if (_writePending || _tx.IsBusy()) {
		LogDebug(std::format("[UART] Write of ${} dropped, transmitter busy", HexUtilities::ToHex(value)));
		return false;
	}
	_pendingData = value;
	_writePending = true;
	return true;
}

void UartLoopback::Acknowledge() {
	_ackPending = true;
}

bool UartLoopback::TryRead(uint8_t& value) {
	if (_ackPending || !_rx.IsReady()) {
		return false;
	}
	value = _rx.GetReceivedByte();
	_ackPending = true;
	return true;
}

void UartLoopback::RunClocks(uint32_t count) {
	UartLinkConfig config = GetLinkConfig();
	for (uint32_t i = 0; i < count; i++) {
		Clock(config);
	}
}

void UartLoopback::Clock(const UartLinkConfig& config) {
	bool sampleTick = false;
	bool bitTick = false;

	_prescaler++;
	if (_prescaler >= std::max<uint32_t>(config.ClocksPerSample, 1)) {
		_prescaler = 0;
		sampleTick = true;

		_sampleIndex++;
		if (_sampleIndex >= UartConstants::SamplesPerBit) {
			_sampleIndex = 0;
			bitTick = true;
		}
	}

	// Line level as driven before this clock edge
	bool line = _tx.GetSerialOut();

	UartRxInputs rxInputs;
	rxInputs.SerialIn = line;
	rxInputs.RxEnable = !config.RxEnabled;
	rxInputs.ReadyAck = _ackPending;
	rxInputs.SampleTick = sampleTick;
	_rx.Tick(rxInputs);

	UartTxInputs txInputs;
	txInputs.DataIn = _pendingData;
	txInputs.TxEnable = !_writePending;
	txInputs.BitTick = bitTick;
	_tx.Tick(txInputs);

	// Both requests are one-clock pulses
	_writePending = false;
	_ackPending = false;
	_clockCount++;
}

uint32_t UartLoopback::GetFrameTimeout() const {
	UartLinkConfig config = GetLinkConfig();
	uint32_t clocksPerBit = std::max<uint32_t>(config.ClocksPerSample, 1) * UartConstants::SamplesPerBit;

	// Up to one bit period waiting for the first bit tick, the frame itself, and one period of slack
	return clocksPerBit * (UartConstants::BitsPerFrame + 2);
}

bool UartLoopback::Transfer(uint8_t value, uint8_t& received) {
	if (!Write(value)) {
		return false;
	}

	UartLinkConfig config = GetLinkConfig();
	uint32_t framesBefore = _rx.GetState().FramesReceived;
	uint32_t timeout = GetFrameTimeout();

	for (uint32_t i = 0; i < timeout; i++) {
		Clock(config);
		if (_rx.GetState().FramesReceived != framesBefore) {
			received = _rx.GetReceivedByte();
			_ackPending = true;
			return true;
		}
	}

	MessageManager::Log(std::format("[UART] Transfer of ${} timed out after {} clocks", HexUtilities::ToHex(value), timeout));
	return false;
}

bool UartLoopback::SaveState(ostream& out) {
	Serializer s(SaveStateVersion, true);
	Serialize(s);
	return s.SaveTo(out);
}

DeserializeResult UartLoopback::LoadState(istream& in) {
	Serializer s(SaveStateVersion, false);
	if (!s.LoadFrom(in)) {
		MessageManager::Log("[UART] Save state rejected (invalid or newer format)");
		return DeserializeResult::InvalidFile;
	}

	Serialize(s);
	if (s.GetMissingKeyCount() > 0) {
		MessageManager::Log(std::format("[UART] Save state loaded with {} missing values", s.GetMissingKeyCount()));
		return DeserializeResult::SpecificError;
	}
	return DeserializeResult::Success;
}

void UartLoopback::Serialize(Serializer& s) {
	SV(_tx);
	SV(_rx);
	SV(_clockCount);
	SV(_prescaler);
	SV(_sampleIndex);
	SV(_pendingData);
	SV(_writePending);
	SV(_ackPending);
}
