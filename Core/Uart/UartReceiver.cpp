#include "pch.h"
#include "Uart/UartReceiver.h"
#include "Shared/UartSettings.h"
#include "Shared/MessageManager.h"
#include "Utilities/HexUtilities.h"
#include "Utilities/Serializer.h"

UartReceiver::UartReceiver(UartSettings* settings)
	: _settings(settings) {
	Reset();
}

void UartReceiver::Reset() {
	_state = {};
	_state.Phase = UartRxPhase::AwaitingStart;
}

UartRxOutputs UartReceiver::Tick(const UartRxInputs& inputs) {
	// Acknowledge first: a frame completing on this same clock sets Ready again
	if (inputs.ReadyAck) {
		_state.Ready = false;
	}

	if (inputs.SampleTick && inputs.IsReceiverActive()) {
		switch (_state.Phase) {
			case UartRxPhase::AwaitingStart: {
				if (_state.SampleCounter == UartConstants::LastSample) {
					// Start bit confirmed, this sample opens the first data bit period
					_state.Phase = UartRxPhase::ReceivingData;
					_state.SampleCounter = 0;
					_state.BitPosition = 0;
					_state.ScratchByte = 0;
				} else if (!inputs.SerialIn) {
					_state.SampleCounter++;
				} else {
					// High before the count completed: glitch, restart detection
					_state.SampleCounter = 0;
				}
				break;
			}

			case UartRxPhase::ReceivingData: {
				uint8_t sample = _state.SampleCounter;
				uint8_t bitPosition = _state.BitPosition;

				if (sample == UartConstants::MidSample && bitPosition < UartConstants::DataBits) {
					if (inputs.SerialIn) {
						_state.ScratchByte |= (1 << bitPosition);
					} else {
						_state.ScratchByte &= ~(1 << bitPosition);
					}
					_state.BitPosition++;
				}

				if (bitPosition == UartConstants::DataBits && sample == UartConstants::LastSample) {
					_state.Phase = UartRxPhase::CheckingStop;
				}

				// Counter is never re-zeroed between bits, it wraps every 16 samples
				_state.SampleCounter = (sample + 1) & UartConstants::LastSample;
				break;
			}

			case UartRxPhase::CheckingStop: {
				if (_state.SampleCounter == UartConstants::LastSample) {
					CommitFrame(false);
				} else if (_state.SampleCounter >= UartConstants::MidSample && !inputs.SerialIn) {
					// At least half the stop bit has elapsed and the line dropped:
					// treat it as the next start bit arriving from a slightly fast sender
					CommitFrame(true);
				} else {
					_state.SampleCounter++;
				}
				break;
			}

			default:
				RecoverInvalidPhase();
				break;
		}
	}

	return {_state.Ready, _state.ReceivedByte};
}

void UartReceiver::CommitFrame(bool earlyStop) {
	if (_state.Ready) {
		_state.Overruns++;
	}

	_state.ReceivedByte = _state.ScratchByte;
	_state.Ready = true;
	_state.SampleCounter = 0;
	_state.Phase = UartRxPhase::AwaitingStart;

	_state.FramesReceived++;
	if (earlyStop) {
		_state.EarlyStopAccepts++;
	}

	if (_settings && _settings->CheckFlag(UartFlags::LogReceivedFrames)) {
		MessageManager::Log(std::format("[UART RX] Received ${}{}", HexUtilities::ToHex(_state.ReceivedByte), earlyStop ? " (early stop)" : ""));
	}
}

void UartReceiver::RecoverInvalidPhase() {
	uint8_t invalidPhase = static_cast<uint8_t>(_state.Phase);

	_state.Phase = UartRxPhase::AwaitingStart;
	_state.SampleCounter = 0;
	_state.Recoveries++;

	if (_settings && _settings->CheckFlag(UartFlags::LogStateRecovery)) {
		MessageManager::Log(std::format("[UART RX] Invalid phase {}, returning to AwaitingStart", invalidPhase));
	}
}

void UartReceiver::Serialize(Serializer& s) {
	SV(_state.Phase);
	SV(_state.SampleCounter);
	SV(_state.BitPosition);
	SV(_state.ScratchByte);
	SV(_state.ReceivedByte);
	SV(_state.Ready);
	SV(_state.FramesReceived);
	SV(_state.EarlyStopAccepts);
	SV(_state.Overruns);
	SV(_state.Recoveries);

	if (!s.IsSaving()) {
		[[maybe_unused]] bool outOfRange = _state.SampleCounter > UartConstants::LastSample || _state.BitPosition > UartConstants::DataBits;
		LogDebugIf(outOfRange, "[UART RX] Save state registers out of range, clamped");
		_state.SampleCounter = std::min(_state.SampleCounter, UartConstants::LastSample);
		_state.BitPosition = std::min(_state.BitPosition, UartConstants::DataBits);
	}
}
