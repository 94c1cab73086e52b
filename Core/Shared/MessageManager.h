#pragma once

#include "pch.h"
#include "Utilities/SimpleLock.h"

/// <summary>Debug logging macro - compiles to nothing in Release builds</summary>
#ifdef _DEBUG
#define LogDebug(msg) MessageManager::Log(msg);
#define LogDebugIf(cond, msg)     \
	if (cond) {                   \
		MessageManager::Log(msg); \
	}
#else
#define LogDebug(msg)
#define LogDebugIf(cond, msg)
#endif

/// <summary>
/// Global log sink for the UART core.
/// </summary>
/// <remarks>
/// Logging:
/// - Log() appends to a bounded in-memory buffer (oldest entries dropped)
/// - Optional stdout output for console debugging
/// - GetLog() retrieves the buffered history
///
/// Usage:
/// <code>
/// MessageManager::Log("[UART RX] Received $A5");
/// LogDebug("[UART TX] Recovered from invalid state"); // DEBUG only
/// </code>
///
/// Thread safety: all methods are thread-safe via SimpleLock.
/// </remarks>
class MessageManager {
private:
	static bool _outputToStdout;   ///< Log to stdout flag
	static SimpleLock _logLock;    ///< Log access synchronization
	static std::list<string> _log; ///< In-memory log buffer

public:
	/// <summary>Maximum number of buffered log lines</summary>
	static constexpr size_t MaxLogSize = 1000;

	/// <summary>
	/// Configure message manager options.
	/// </summary>
	/// <param name="outputToStdout">Output logs to stdout</param>
	static void SetOptions(bool outputToStdout);

	/// <summary>
	/// Log message to memory buffer and optionally stdout.
	/// </summary>
	/// <param name="message">Log message (empty string logs a separator line)</param>
	static void Log(string message = "");

	/// <summary>Clear in-memory log buffer</summary>
	static void ClearLog();

	/// <summary>
	/// Get full log history as newline-separated string.
	/// </summary>
	static string GetLog();

	/// <summary>Number of lines currently buffered</summary>
	static size_t GetLogSize();
};
