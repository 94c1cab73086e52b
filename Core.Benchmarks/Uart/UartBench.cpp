#include "pch.h"
#include "Uart/UartReceiver.h"
#include "Uart/UartTransmitter.h"
#include "Uart/UartLoopback.h"

// =============================================================================
// UART Core Benchmarks
// =============================================================================
// Both engines are evaluated on every system clock. Most clocks carry no tick
// enable (the receiver only advances once every ClocksPerSample clocks), so
// the gated-off path should be close to free.
//
// Hot paths: UartReceiver::Tick (idle line, mid-frame), UartTransmitter::Tick
// Cold paths: loopback Transfer (full frame), save state

// -----------------------------------------------------------------------------
// Receiver
// -----------------------------------------------------------------------------

static void BM_UartRx_TickGatedOff(benchmark::State& state) {
	UartReceiver rx;
	UartRxInputs inputs;
	inputs.SerialIn = false;
	inputs.SampleTick = false;

	for (auto _ : state) {
		UartRxOutputs out = rx.Tick(inputs);
		benchmark::DoNotOptimize(out);
	}
	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_UartRx_TickGatedOff);

static void BM_UartRx_TickIdleLine(benchmark::State& state) {
	UartReceiver rx;
	UartRxInputs inputs;
	inputs.SerialIn = true;
	inputs.SampleTick = true;

	for (auto _ : state) {
		UartRxOutputs out = rx.Tick(inputs);
		benchmark::DoNotOptimize(out);
	}
	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_UartRx_TickIdleLine);

static void BM_UartRx_FullFrame(benchmark::State& state) {
	UartReceiver rx;
	UartRxInputs inputs;
	inputs.SampleTick = true;
	uint8_t value = 0;

	for (auto _ : state) {
		inputs.ReadyAck = true;
		for (int bit = 0; bit < UartConstants::BitsPerFrame; bit++) {
			if (bit == 0) {
				inputs.SerialIn = false;
			} else if (bit <= UartConstants::DataBits) {
				inputs.SerialIn = (value >> (bit - 1)) & 0x01;
			} else {
				inputs.SerialIn = true;
			}
			for (int i = 0; i < UartConstants::SamplesPerBit; i++) {
				rx.Tick(inputs);
				inputs.ReadyAck = false;
			}
		}
		uint8_t data = rx.GetReceivedByte();
		benchmark::DoNotOptimize(data);
		value++;
	}
	state.SetItemsProcessed(state.iterations());
	state.SetBytesProcessed(state.iterations());
}
BENCHMARK(BM_UartRx_FullFrame);

// -----------------------------------------------------------------------------
// Transmitter
// -----------------------------------------------------------------------------

static void BM_UartTx_TickIdle(benchmark::State& state) {
	UartTransmitter tx;
	UartTxInputs inputs;
	inputs.BitTick = true;

	for (auto _ : state) {
		UartTxOutputs out = tx.Tick(inputs);
		benchmark::DoNotOptimize(out);
	}
	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_UartTx_TickIdle);

static void BM_UartTx_FullFrame(benchmark::State& state) {
	UartTransmitter tx;
	UartTxInputs request;
	request.TxEnable = false;
	UartTxInputs tick;
	tick.BitTick = true;

	for (auto _ : state) {
		tx.Tick(request);
		for (int i = 0; i < UartConstants::BitsPerFrame; i++) {
			UartTxOutputs out = tx.Tick(tick);
			benchmark::DoNotOptimize(out);
		}
		request.DataIn++;
	}
	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_UartTx_FullFrame);

// -----------------------------------------------------------------------------
// Loopback
// -----------------------------------------------------------------------------

static void BM_UartLoopback_Transfer(benchmark::State& state) {
	UartLoopback link;
	uint8_t value = 0;
	uint8_t received = 0;

	for (auto _ : state) {
		bool ok = link.Transfer(value++, received);
		benchmark::DoNotOptimize(ok);
		benchmark::DoNotOptimize(received);
	}
	state.SetItemsProcessed(state.iterations());
	state.SetBytesProcessed(state.iterations());
}
BENCHMARK(BM_UartLoopback_Transfer);

static void BM_UartLoopback_SaveState(benchmark::State& state) {
	UartLoopback link;
	if (!link.Write(0xA5)) {
		state.SkipWithError("Transmitter busy");
		return;
	}
	link.RunClocks(80);

	for (auto _ : state) {
		std::stringstream ss;
		bool saved = link.SaveState(ss);
		benchmark::DoNotOptimize(saved);
	}
	state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_UartLoopback_SaveState);
