#pragma once

#include <stddef.h>
#include <stdint.h>

//normal text colors
#define COLRED "\e[31m"
#define COLYEL "\e[33m"
#define COLBLU "\e[34m"
#define COLWHT "\e[37m"

//Reset
#define COLRESET "\e[0m"

#define LOGVER(str, ...) logging::log_advanced(logging::LEVEL::Cverbose, COLBLU"[VERB] %s: " str, __FUNCTION__, ## __VA_ARGS__)
#define LOGINF(str, ...) logging::log_advanced(logging::LEVEL::Cinfo, COLWHT"[INFO] %s: " str, __FUNCTION__, ## __VA_ARGS__)
#define LOGERR(str, ...) logging::log_advanced(logging::LEVEL::Cerror, COLRED"[ERROR] %s: " str, __FUNCTION__, ## __VA_ARGS__)
#define LOGWAR(str, ...) logging::log_advanced(logging::LEVEL::Cwarning, COLYEL"[WARN] %s: " str, __FUNCTION__, ## __VA_ARGS__)

#define LOGBLK logging::block logblock;

namespace logging{

	enum LEVEL : size_t {
		Cwarning,
		Cerror,
		Cinfo,
		Cverbose,
		LEVEL_ITEM_COUNT
	};

	void log_advanced(LEVEL lvl, const char* str, ...);
	void indent();
	void undent();
	void set_channel(LEVEL lvl, bool state);
	//amount of messages that passed their channel filter
	uint64_t count();
	//terminates the pending status line, if any
	void flush();

	class block{
	public:
		block(){ indent(); }
		~block(){ undent(); }
	};
}
