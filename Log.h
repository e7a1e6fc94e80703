#pragma once

#include <array>
#include <fstream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// For debugging convenience only - do not leave in stable code
#define TPV_LOG_VAR(a) logger << a << " - " << #a << "\n"

class Logger {
public:
	Logger();

	// Closes the current log and starts writing to the given file instead
	void redirect(std::string const& filename);

	void setFlushFlag(bool val) { doFlush_ = val; }

	template<typename T>
	auto operator<<(const T& obj)
		-> decltype(std::ofstream() << obj, *this)&;

	template<typename T,
		std::enable_if_t<std::is_enum<T>::value, int> = 0>
	auto operator<<(const T& obj)
		-> decltype(std::ofstream() << static_cast<int>(obj), *this)&;

	template<typename T>
	Logger& operator<<(const std::vector<T>& obj);

	template<typename T, size_t X>
	Logger& operator<<(const std::array<T, X>& obj);

	template<typename T, typename U>
	Logger& operator<<(const std::pair<T, U>& obj);

	template<typename T>
	Logger& operator<<(const std::optional<T>& obj);

private:
	void resetLog();

	void flushIf() { if (doFlush_) fileStream_.flush(); }

	template<typename Container>
	void writeSequence(Container const& obj);

	bool doFlush_ = true;

	std::string filename_;

	std::ofstream fileStream_;
};

extern Logger logger;

template<typename T>
auto Logger::operator<<(const T& obj)
-> decltype(std::ofstream() << obj, *this)&
{
	fileStream_ << obj;
	flushIf();
	return *this;
}

template<typename T,
	std::enable_if_t<std::is_enum<T>::value, int>>
auto Logger::operator<<(const T& obj)
-> decltype(std::ofstream() << static_cast<int>(obj), *this)&
{
	fileStream_ << static_cast<int>(obj);
	flushIf();
	return *this;
}

template<typename Container>
inline void Logger::writeSequence(Container const& obj) {
	bool prevFlush = doFlush_;
	setFlushFlag(false);
	fileStream_ << "[";
	bool firstItem = true;
	for (auto const& component : obj) {
		if (!firstItem) fileStream_ << ", ";
		*this << component;
		firstItem = false;
	}
	fileStream_ << "]";
	setFlushFlag(prevFlush);
	flushIf();
}

template<typename T>
inline Logger& Logger::operator<<(const std::vector<T>& obj) {
	writeSequence(obj);
	return *this;
}

template<typename T, size_t X>
inline Logger& Logger::operator<<(const std::array<T, X>& obj)
{
	writeSequence(obj);
	return *this;
}

template<typename T, typename U>
inline Logger& Logger::operator<<(const std::pair<T, U>& obj)
{
	bool prevFlush = doFlush_;
	setFlushFlag(false);
	*this << "[" << obj.first << ", " << obj.second << "]";
	setFlushFlag(prevFlush);
	flushIf();
	return *this;
}

template<typename T>
inline Logger& Logger::operator<<(const std::optional<T>& obj)
{
	if (obj) return *this << *obj;
	return *this << "none";
}
