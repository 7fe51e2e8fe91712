#pragma once
#ifndef _LOG_H_
#define _LOG_H_
#include <array>
#include <string>
#include <string_view>
#include <list>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <format>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <ctime>
#ifdef _MSC_VER
	#ifndef NOMINMAX
		#define NOMINMAX
	#endif
	#include <windows.h>
#endif

enum enLogLevel : int {
	c_log_dbg,
	c_log_info,
	c_log_warn,
	c_log_err
};

struct log_time {
	int sec{};
	int min{};
	int hour{};
	int mday{};
	int mon{};
	int year{};
};

inline log_time log_now() {
#ifdef _MSC_VER
	SYSTEMTIME t{};
	GetLocalTime(&t);
	return log_time{t.wSecond, t.wMinute, t.wHour, t.wDay, t.wMonth, t.wYear};
#else
	auto tt{std::chrono::system_clock::to_time_t(std::chrono::system_clock::now())};
	std::tm ct{};
	localtime_r(&tt, &ct);
	return log_time{ct.tm_sec, ct.tm_min, ct.tm_hour, ct.tm_mday, ct.tm_mon + 1, ct.tm_year + 1900};
#endif
}

// messages are formatted on the caller thread and written by one worker
class log__ {
	static constexpr std::array<std::string_view, 4> level_{"DBG", "INFO", "WARN", "ERR"};
	std::list<std::string> msgs_;
	std::mutex msgs_mtx_;
	std::condition_variable cv_;
	std::atomic<int> min_level_{c_log_info};
	std::atomic<bool> write_file_{};
	std::filesystem::path file_dir_{};
	std::fstream file_;
	int day_{};
	std::mutex file_mtx_;
	bool run_{true};
	std::thread th_;

	void write(const std::string& msg) {
		std::lock_guard lk(file_mtx_);
		if (!write_file_) {
			std::cout << msg << std::endl;
			return;
		}
		if (!file_.is_open()) {
			auto tm{log_now()};
			auto f{file_dir_ / std::format("roofshade-{}-{:02}-{:02}.log", tm.year, tm.mon, tm.mday)};
			file_.open(f, std::ios_base::out | std::ios_base::app);
			if (!file_.is_open()) {
				std::cerr << std::format("log file {} unavailable\n", f.string());
				std::cout << msg << std::endl;
				return;
			}
		}
		file_ << msg << "\n";
	}

	void drain() {
		std::unique_lock ul(msgs_mtx_);
		while (true) {
			cv_.wait(ul, [&] { return !run_ || !msgs_.empty(); });
			if (msgs_.empty() && !run_) return;
			std::list<std::string> batch;
			batch.swap(msgs_);
			ul.unlock();
			for (const auto& msg : batch) {
				write(msg);
			}
			ul.lock();
		}
	}

public:
	log__() {
		th_ = std::thread([this]() { drain(); });
	}

	~log__() {
		{
			std::lock_guard lg(msgs_mtx_);
			run_ = false;
		}
		cv_.notify_one();
		th_.join();
		std::lock_guard lk(file_mtx_);
		if (file_.is_open()) {
			file_.flush();
			file_.close();
		}
	}

	log__(const log__&) = delete;
	log__& operator=(const log__&) = delete;

	void level(int lv) {
		min_level_ = lv;
	}

	void write_file(bool b, const std::filesystem::path& dir = {}) {
		std::lock_guard lk(file_mtx_);
		if (file_.is_open()) file_.close();
		file_dir_ = dir;
		write_file_ = b;
	}

	template <class... Args>
	void log_msg(int level, std::format_string<Args...> fmt, Args&&... args) {
		if (level < min_level_) return;
		auto tm{log_now()};
		{
			std::lock_guard lg(file_mtx_);
			if (tm.mday != day_) {
				day_ = tm.mday;
				if (file_.is_open()) file_.close();
			}
		}
		std::string msg{std::format("[{:02}:{:02}:{:02}][{}]", tm.hour, tm.min, tm.sec, level_[level])};
		msg.append(std::format(fmt, std::forward<Args>(args)...));
		{
			std::lock_guard mlg(msgs_mtx_);
			msgs_.emplace_back(std::move(msg));
		}
		cv_.notify_one();
	}

	template <class... Args>
	void dbg(std::format_string<Args...> fmt, Args&&... args) {
		log_msg(c_log_dbg, fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	void info(std::format_string<Args...> fmt, Args&&... args) {
		log_msg(c_log_info, fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	void warn(std::format_string<Args...> fmt, Args&&... args) {
		log_msg(c_log_warn, fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	void err(std::format_string<Args...> fmt, Args&&... args) {
		log_msg(c_log_err, fmt, std::forward<Args>(args)...);
	}
};
inline log__ glog;
#endif
