#include "pch.h"
#include "Uart/UartTransmitter.h"
#include "Shared/UartSettings.h"
#include "Shared/MessageManager.h"
#include "Utilities/Serializer.h"

/// <summary>
/// Tests for the per-bit-tick transmitter.
///
/// Every BitTick clock advances one bit period. A requested frame produces,
/// on consecutive bit ticks: start (low), 8 data bits LSB first, then the
/// stop level (high) as the engine returns to Idle.
///
/// Test categories:
///   1. Idle behavior and request latching
///   2. Frame waveform
///   3. Busy flag and ignored requests
///   4. Invalid phase recovery
///   5. Logging and save states
/// </summary>

class UartTransmitterTest : public ::testing::Test {
protected:
	UartTransmitter _tx;

	void SetUp() override {
		_tx.Reset();
	}

	/// <summary>Clock with tx_enable asserted (low) and no bit tick</summary>
	UartTxOutputs Request(uint8_t value) {
		UartTxInputs inputs;
		inputs.DataIn = value;
		inputs.TxEnable = false;
		inputs.BitTick = false;
		return _tx.Tick(inputs);
	}

	UartTxOutputs BitTick(uint8_t dataIn = 0) {
		UartTxInputs inputs;
		inputs.DataIn = dataIn;
		inputs.BitTick = true;
		return _tx.Tick(inputs);
	}

	UartTxOutputs IdleClock() {
		UartTxInputs inputs;
		return _tx.Tick(inputs);
	}

	/// <summary>Line levels seen after each of the 10 bit ticks of one frame</summary>
	vector<bool> CaptureFrame(uint8_t value) {
		vector<bool> levels;
		Request(value);
		for (int i = 0; i < UartConstants::BitsPerFrame; i++) {
			levels.push_back(BitTick().SerialOut);
		}
		return levels;
	}
};

// =============================================================================
// 1. Idle / Request
// =============================================================================

TEST_F(UartTransmitterTest, Idle_LineHighAndNotBusy) {
	EXPECT_TRUE(_tx.GetSerialOut());
	EXPECT_FALSE(_tx.IsBusy());
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Idle);

	for (int i = 0; i < 20; i++) {
		UartTxOutputs out = BitTick(0x00);
		EXPECT_TRUE(out.SerialOut);
		EXPECT_FALSE(out.Busy);
	}
}

TEST_F(UartTransmitterTest, TxEnablePolarity) {
	UartTxInputs inputs;
	EXPECT_FALSE(inputs.IsTransmitRequested());
	inputs.TxEnable = false;
	EXPECT_TRUE(inputs.IsTransmitRequested());
}

TEST_F(UartTransmitterTest, Request_LatchesWithoutBitTick) {
	UartTxOutputs out = Request(0xA5);
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Start);
	EXPECT_EQ(_tx.GetState().Buffer, 0xA5);
	EXPECT_EQ(_tx.GetState().BitPosition, 0);
	EXPECT_TRUE(out.Busy);

	// Start bit is not driven until the next bit tick
	EXPECT_TRUE(out.SerialOut);
}

TEST_F(UartTransmitterTest, Request_HeldLineDoesNotDriveStartEarly) {
	Request(0x0F);
	Request(0x0F);
	Request(0x0F);
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Start);
	EXPECT_TRUE(_tx.GetSerialOut());
}

// =============================================================================
// 2. Frame Waveform
// =============================================================================

TEST_F(UartTransmitterTest, Frame_A5Waveform) {
	vector<bool> levels = CaptureFrame(0xA5);

	// start, 1 0 1 0 0 1 0 1 (LSB first), stop
	vector<bool> expected = {false, true, false, true, false, false, true, false, true, true};
	EXPECT_EQ(levels, expected);
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Idle);
}

TEST_F(UartTransmitterTest, Frame_EveryValueLsbFirst) {
	for (int value = 0; value < 256; value++) {
		vector<bool> levels = CaptureFrame(static_cast<uint8_t>(value));
		ASSERT_EQ(levels.size(), 10u);
		EXPECT_FALSE(levels[0]);
		for (int bit = 0; bit < 8; bit++) {
			EXPECT_EQ(levels[bit + 1], ((value >> bit) & 0x01) != 0) << "value " << value << " bit " << bit;
		}
		EXPECT_TRUE(levels[9]);
	}
}

TEST_F(UartTransmitterTest, Frame_LineHeldBetweenBitTicks) {
	Request(0x00);
	BitTick();
	for (int i = 0; i < 15; i++) {
		EXPECT_FALSE(IdleClock().SerialOut);
	}
}

TEST_F(UartTransmitterTest, Frame_BitPositionStaysAtLastBitDuringStop) {
	Request(0xFF);
	for (int i = 0; i < 9; i++) {
		BitTick();
	}
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Stop);
	EXPECT_EQ(_tx.GetState().BitPosition, 7);
}

TEST_F(UartTransmitterTest, Frame_DataInChangesIgnoredAfterLatch) {
	Request(0xF0);
	vector<bool> levels;
	for (int i = 0; i < 10; i++) {
		levels.push_back(BitTick(0x0F).SerialOut);
	}

	vector<bool> expected = {false, false, false, false, false, true, true, true, true, true};
	EXPECT_EQ(levels, expected);
	EXPECT_EQ(_tx.GetState().Buffer, 0xF0);
}

TEST_F(UartTransmitterTest, Frame_BackToBack) {
	CaptureFrame(0x12);
	vector<bool> levels = CaptureFrame(0x80);
	EXPECT_FALSE(levels[0]);
	EXPECT_TRUE(levels[8]);
	EXPECT_EQ(_tx.GetState().FramesSent, 2u);
}

// =============================================================================
// 3. Busy / Ignored Requests
// =============================================================================

TEST_F(UartTransmitterTest, Busy_AssertedUntilStopTick) {
	EXPECT_TRUE(Request(0x55).Busy);
	for (int i = 0; i < 9; i++) {
		EXPECT_TRUE(BitTick().Busy);
	}
	EXPECT_FALSE(BitTick().Busy);
}

TEST_F(UartTransmitterTest, Busy_RequestIgnored) {
	Request(0x3C);
	BitTick();
	BitTick();
	Request(0xC3);
	EXPECT_EQ(_tx.GetState().Buffer, 0x3C);
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Data);
	EXPECT_EQ(_tx.GetState().BitPosition, 1);
}

// =============================================================================
// 4. Invalid Phase Recovery
// =============================================================================

TEST_F(UartTransmitterTest, Recovery_InvalidPhaseReturnsToIdleWithoutTick) {
	_tx.GetState().Phase = static_cast<UartTxPhase>(6);
	_tx.GetState().Line = false;

	UartTxOutputs out = IdleClock();
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Idle);
	EXPECT_TRUE(out.SerialOut);
	EXPECT_FALSE(out.Busy);
	EXPECT_EQ(_tx.GetState().Recoveries, 1u);

	vector<bool> levels = CaptureFrame(0x01);
	EXPECT_TRUE(levels[1]);
}

TEST_F(UartTransmitterTest, Reset_ClearsFrameInProgress) {
	Request(0x00);
	BitTick();
	_tx.Reset();
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Idle);
	EXPECT_TRUE(_tx.GetSerialOut());
	EXPECT_EQ(_tx.GetState().FramesSent, 0u);
}

// =============================================================================
// 5. Logging and Save States
// =============================================================================

TEST_F(UartTransmitterTest, Log_TransmittedFrames) {
	UartSettings settings;
	settings.SetFlag(UartFlags::LogTransmittedFrames);
	UartTransmitter tx(&settings);

	MessageManager::ClearLog();
	UartTxInputs request;
	request.DataIn = 0x5A;
	request.TxEnable = false;
	tx.Tick(request);

	UartTxInputs tick;
	tick.BitTick = true;
	for (int i = 0; i < 10; i++) {
		tx.Tick(tick);
	}

	EXPECT_NE(MessageManager::GetLog().find("[UART TX] Sent $5A (01011010)"), string::npos);
}

TEST_F(UartTransmitterTest, Log_RecoveryOnlyWhenFlagSet) {
	UartSettings settings;
	UartTransmitter tx(&settings);
	MessageManager::ClearLog();

	tx.GetState().Phase = static_cast<UartTxPhase>(4);
	tx.Tick(UartTxInputs());
	EXPECT_EQ(MessageManager::GetLogSize(), 0u);

	settings.SetFlag(UartFlags::LogStateRecovery);
	tx.GetState().Phase = static_cast<UartTxPhase>(4);
	tx.Tick(UartTxInputs());
	EXPECT_NE(MessageManager::GetLog().find("[UART TX] Invalid phase 4"), string::npos);
}

TEST_F(UartTransmitterTest, SaveState_BitPositionClampedOnLoad) {
	uint8_t phase = static_cast<uint8_t>(UartTxPhase::Data);
	uint8_t bitPosition = 40;
	uint8_t buffer = 0x80;
	Serializer saver(1, true);
	saver.Stream(phase, "Phase");
	saver.Stream(bitPosition, "BitPosition");
	saver.Stream(buffer, "Buffer");
	std::stringstream ss;
	ASSERT_TRUE(saver.SaveTo(ss));

	Serializer loader(1, false);
	ASSERT_TRUE(loader.LoadFrom(ss));
	_tx.Serialize(loader);
	EXPECT_EQ(_tx.GetState().BitPosition, 7);

	// Last data bit, then stop
	EXPECT_TRUE(BitTick().SerialOut);
	EXPECT_EQ(_tx.GetPhase(), UartTxPhase::Stop);
	EXPECT_FALSE(BitTick().Busy);
}

TEST_F(UartTransmitterTest, SaveState_ResumesMidFrame) {
	Request(0x96);
	BitTick();
	BitTick();
	BitTick();

	Serializer saver(1, true);
	_tx.Serialize(saver);
	std::stringstream ss;
	ASSERT_TRUE(saver.SaveTo(ss));

	UartTransmitter restored;
	Serializer loader(1, false);
	ASSERT_TRUE(loader.LoadFrom(ss));
	restored.Serialize(loader);

	EXPECT_EQ(restored.GetPhase(), _tx.GetPhase());
	for (int i = 0; i < 7; i++) {
		UartTxInputs tick;
		tick.BitTick = true;
		EXPECT_EQ(restored.Tick(tick).SerialOut, BitTick().SerialOut);
	}
	EXPECT_FALSE(restored.IsBusy());
}
