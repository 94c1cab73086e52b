#pragma once
#include "pch.h"

// ============================================================================
// Constants
// ============================================================================

class UartConstants {
public:
	/// <summary>Receiver oversampling ticks per bit period</summary>
	static constexpr uint8_t SamplesPerBit = 16;

	/// <summary>Last sample index of a bit period (counter wraps after it)</summary>
	static constexpr uint8_t LastSample = SamplesPerBit - 1;

	/// <summary>Sample index at which a data bit is captured (bit-period midpoint)</summary>
	static constexpr uint8_t MidSample = 8;

	/// <summary>Data bits per frame (8-N-1)</summary>
	static constexpr uint8_t DataBits = 8;

	/// <summary>Bit periods per frame: 1 start + 8 data + 1 stop</summary>
	static constexpr uint8_t BitsPerFrame = 1 + DataBits + 1;

	/// <summary>Idle (mark) level of the serial line</summary>
	static constexpr bool IdleLevel = true;
};

// ============================================================================
// State machine phases
// ============================================================================

enum class UartRxPhase : uint8_t {
	AwaitingStart = 0,
	ReceivingData = 1,
	CheckingStop = 2,
};

enum class UartTxPhase : uint8_t {
	Idle = 0,
	Start = 1,
	Data = 2,
	Stop = 3,
};

// ============================================================================
// Receiver
// ============================================================================

/// <summary>Signals sampled by the receiver on one system clock</summary>
struct UartRxInputs {
	/// <summary>Raw serial line (serial_in)</summary>
	bool SerialIn = UartConstants::IdleLevel;

	/// <summary>
	/// Raw rx_enable line. Inverted polarity: the receiver runs while this
	/// line is LOW. Use IsReceiverActive() rather than reading it directly.
	/// </summary>
	bool RxEnable = false;

	/// <summary>ready_ack: clears Ready, sampled every clock regardless of gating</summary>
	bool ReadyAck = false;

	/// <summary>oversample_tick_enable: one pulse per 1/16 bit period</summary>
	bool SampleTick = false;

	[[nodiscard]] bool IsReceiverActive() const { return !RxEnable; }
};

/// <summary>Receiver outputs after one system clock</summary>
struct UartRxOutputs {
	/// <summary>ready: sticky until acknowledged</summary>
	bool Ready;

	/// <summary>rx_data: last committed byte</summary>
	uint8_t Data;
};

struct UartRxState {
	UartRxPhase Phase;

	/// <summary>Oversampling ticks elapsed in the current bit period (0-15)</summary>
	uint8_t SampleCounter;

	/// <summary>Index of the next data bit to capture; reaches 8 after the last one</summary>
	uint8_t BitPosition;

	/// <summary>Accumulator for the frame in progress, committed only on stop acceptance</summary>
	uint8_t ScratchByte;

	/// <summary>Last committed byte</summary>
	uint8_t ReceivedByte;

	bool Ready;

	// --- Diagnostics (never affect outputs) ---
	uint32_t FramesReceived;

	/// <summary>Stop conditions accepted through the early-low branch</summary>
	uint32_t EarlyStopAccepts;

	/// <summary>Bytes committed while the previous one was still unacknowledged</summary>
	uint32_t Overruns;

	/// <summary>Recoveries from an out-of-range Phase value</summary>
	uint32_t Recoveries;
};

// ============================================================================
// Transmitter
// ============================================================================

/// <summary>Signals sampled by the transmitter on one system clock</summary>
struct UartTxInputs {
	/// <summary>tx_data_in: latched only on the Idle to Start transition</summary>
	uint8_t DataIn = 0;

	/// <summary>
	/// Raw tx_enable line. Inverted polarity: a frame starts while this line
	/// is LOW. Use IsTransmitRequested() rather than reading it directly.
	/// </summary>
	bool TxEnable = true;

	/// <summary>bit_tick_enable: one pulse per full bit period</summary>
	bool BitTick = false;

	[[nodiscard]] bool IsTransmitRequested() const { return !TxEnable; }
};

/// <summary>Transmitter outputs after one system clock</summary>
struct UartTxOutputs {
	/// <summary>serial_out: idle high</summary>
	bool SerialOut;

	/// <summary>tx_busy: true in every phase except Idle</summary>
	bool Busy;
};

struct UartTxState {
	UartTxPhase Phase;

	/// <summary>Byte latched at Idle to Start, unchanged until the frame ends</summary>
	uint8_t Buffer;

	/// <summary>Data bit being emitted (0-7)</summary>
	uint8_t BitPosition;

	/// <summary>Driven line level</summary>
	bool Line;

	// --- Diagnostics ---
	uint32_t FramesSent;
	uint32_t Recoveries;
};
