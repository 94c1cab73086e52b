#pragma once
#include "pch.h"
#include <thread>

class SimpleLock;

/// <summary>
/// RAII guard for SimpleLock. Releases on scope exit unless Release() was
/// already called.
/// </summary>
class LockHandler {
private:
	SimpleLock* _lock;
	bool _released = false;

public:
	LockHandler(SimpleLock* lock);
	LockHandler(const LockHandler&) = delete;
	LockHandler& operator=(const LockHandler&) = delete;
	LockHandler(LockHandler&& other) noexcept;

	/// <summary>Release the lock early (safe to call more than once)</summary>
	void Release();

	~LockHandler();
};

/// <summary>
/// Recursive spin lock built on atomic_flag, with owner tracking.
/// The same thread may acquire it several times and must release it the
/// same number of times.
/// </summary>
/// <remarks>
/// Used for the shared log buffer and the settings object, which are the
/// only state the tick engines share with other threads.
/// </remarks>
class SimpleLock {
private:
	thread_local static std::thread::id _threadID;

	std::thread::id _holderThreadID;
	uint32_t _lockCount;
	atomic_flag _lock;

public:
	SimpleLock();
	~SimpleLock();

	/// <summary>Acquire the lock and return a guard that releases it</summary>
	LockHandler AcquireSafe();

	/// <summary>Acquire the lock (blocks). Must be paired with Release().</summary>
	void Acquire();

	/// <summary>True when no thread holds the lock</summary>
	bool IsFree();

	/// <summary>True when the calling thread holds the lock</summary>
	bool IsLockedByCurrentThread();

	/// <summary>Decrement the recursion count, freeing the lock at zero</summary>
	void Release();
};
