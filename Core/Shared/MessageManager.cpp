#include "pch.h"
#include "Shared/MessageManager.h"

std::list<string> MessageManager::_log;
SimpleLock MessageManager::_logLock;
bool MessageManager::_outputToStdout = false;

void MessageManager::SetOptions(bool outputToStdout) {
	_outputToStdout = outputToStdout;
}

void MessageManager::Log(string message) {
	auto lock = _logLock.AcquireSafe();
	if (message.empty()) {
		message = "------------------------------------------------------";
	}
	if (_log.size() >= MaxLogSize) {
		_log.pop_front();
	}
	_log.push_back(message);

	if (_outputToStdout) {
		std::cout << message << std::endl;
	}
}

void MessageManager::ClearLog() {
	auto lock = _logLock.AcquireSafe();
	_log.clear();
}

string MessageManager::GetLog() {
	auto lock = _logLock.AcquireSafe();
	stringstream ss;
	for (string& msg : _log) {
		ss << msg << "\n";
	}
	return ss.str();
}

size_t MessageManager::GetLogSize() {
	auto lock = _logLock.AcquireSafe();
	return _log.size();
}
