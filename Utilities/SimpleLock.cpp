#include "pch.h"
#include "Utilities/SimpleLock.h"

thread_local std::thread::id SimpleLock::_threadID = std::this_thread::get_id();

SimpleLock::SimpleLock() {
	_lock.clear();
	_lockCount = 0;
	_holderThreadID = std::thread::id();
}

SimpleLock::~SimpleLock() {
}

LockHandler SimpleLock::AcquireSafe() {
	return LockHandler(this);
}

void SimpleLock::Acquire() {
	if (_lockCount == 0 || _holderThreadID != _threadID) {
		while (_lock.test_and_set(std::memory_order_acquire)) {
			std::this_thread::yield();
		}
		_holderThreadID = _threadID;
		_lockCount = 1;
	} else {
		// Recursive acquisition by the owning thread
		_lockCount++;
	}
}

bool SimpleLock::IsFree() {
	return _lockCount == 0;
}

bool SimpleLock::IsLockedByCurrentThread() {
	return _lockCount > 0 && _holderThreadID == _threadID;
}

void SimpleLock::Release() {
	if (_lockCount > 0 && _holderThreadID == _threadID) {
		_lockCount--;
		if (_lockCount == 0) {
			_holderThreadID = std::thread::id();
			_lock.clear(std::memory_order_release);
		}
	}
}

LockHandler::LockHandler(SimpleLock* lock) {
	_lock = lock;
	_lock->Acquire();
}

LockHandler::LockHandler(LockHandler&& other) noexcept {
	_lock = other._lock;
	_released = other._released;
	other._released = true;
}

void LockHandler::Release() {
	if (!_released) {
		_lock->Release();
		_released = true;
	}
}

LockHandler::~LockHandler() {
	Release();
}
