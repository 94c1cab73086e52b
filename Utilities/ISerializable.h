#pragma once

class Serializer;

/// <summary>
/// Result codes for loading a saved state.
/// </summary>
enum class DeserializeResult {
	/// <summary>State loaded successfully</summary>
	Success,

	/// <summary>Not a valid state stream (truncated, malformed or from a newer version)</summary>
	InvalidFile,

	/// <summary>Stream was valid but one or more keys were missing; those values kept their previous contents</summary>
	SpecificError,
};

/// <summary>
/// Interface for objects whose registers can be saved and restored.
/// Both tick engines, the loopback harness and the settings implement it.
/// </summary>
/// <remarks>
/// The same Serialize() method handles both directions; the Serializer
/// knows whether it is saving or loading.
/// <code>
/// void UartReceiver::Serialize(Serializer& s) {
///     SV(_state.Phase);
///     SV(_state.SampleCounter);
/// }
/// </code>
/// Keys are derived from member names, so renaming a member breaks
/// compatibility with older saved states.
/// </remarks>
class ISerializable {
public:
	virtual ~ISerializable() = default;

	/// <summary>
	/// Serialize or deserialize object state based on Serializer mode.
	/// </summary>
	virtual void Serialize(Serializer& s) = 0;
};
