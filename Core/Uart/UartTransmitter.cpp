#include "pch.h"
#include "Uart/UartTransmitter.h"
#include "Shared/UartSettings.h"
#include "Shared/MessageManager.h"
#include "Utilities/HexUtilities.h"
#include "Utilities/Serializer.h"

UartTransmitter::UartTransmitter(UartSettings* settings)
	: _settings(settings) {
	Reset();
}

void UartTransmitter::Reset() {
	_state = {};
	_state.Phase = UartTxPhase::Idle;
	_state.Line = UartConstants::IdleLevel;
}

UartTxOutputs UartTransmitter::Tick(const UartTxInputs& inputs) {
	switch (_state.Phase) {
		case UartTxPhase::Idle:
			if (inputs.IsTransmitRequested()) {
				_state.Buffer = inputs.DataIn;
				_state.BitPosition = 0;
				_state.Phase = UartTxPhase::Start;
			}
			break;

		case UartTxPhase::Start:
			if (inputs.BitTick) {
				_state.Line = false;
				_state.Phase = UartTxPhase::Data;
			}
			break;

		case UartTxPhase::Data:
			if (inputs.BitTick) {
				_state.Line = (_state.Buffer >> _state.BitPosition) & 0x01;
				if (_state.BitPosition == UartConstants::DataBits - 1) {
					_state.Phase = UartTxPhase::Stop;
				} else {
					_state.BitPosition++;
				}
			}
			break;

		case UartTxPhase::Stop:
			if (inputs.BitTick) {
				_state.Line = UartConstants::IdleLevel;
				_state.Phase = UartTxPhase::Idle;
				_state.FramesSent++;

				if (_settings && _settings->CheckFlag(UartFlags::LogTransmittedFrames)) {
					MessageManager::Log(std::format("[UART TX] Sent ${} ({})", HexUtilities::ToHex(_state.Buffer), HexUtilities::ToBinary(_state.Buffer)));
				}
			}
			break;

		default:
			RecoverInvalidPhase();
			break;
	}

	return {_state.Line, IsBusy()};
}

void UartTransmitter::RecoverInvalidPhase() {
	uint8_t invalidPhase = static_cast<uint8_t>(_state.Phase);

	_state.Line = UartConstants::IdleLevel;
	_state.Phase = UartTxPhase::Idle;
	_state.Recoveries++;

	if (_settings && _settings->CheckFlag(UartFlags::LogStateRecovery)) {
		MessageManager::Log(std::format("[UART TX] Invalid phase {}, returning to Idle", invalidPhase));
	}
}

void UartTransmitter::Serialize(Serializer& s) {
	SV(_state.Phase);
	SV(_state.Buffer);
	SV(_state.BitPosition);
	SV(_state.Line);
	SV(_state.FramesSent);
	SV(_state.Recoveries);

	if (!s.IsSaving()) {
		// Data drives bit BitPosition and leaves at bit 7
		LogDebugIf(_state.BitPosition >= UartConstants::DataBits, "[UART TX] Save state bit position out of range, clamped");
		_state.BitPosition = std::min<uint8_t>(_state.BitPosition, UartConstants::DataBits - 1);
	}
}
