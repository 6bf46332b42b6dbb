/*

log.cpp
-------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <spdlog/sinks/stdout_color_sinks.h>
#include <uidbox/log.hpp>


using std::shared_ptr;
using std::string;


namespace uidbox
{


const string LOGGER_NAME{"uidbox"};


shared_ptr<spdlog::logger> logger()
{
    static shared_ptr<spdlog::logger> instance = []()
    {
        auto existing = spdlog::get(LOGGER_NAME);
        if (existing)
            return existing;
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}


} // namespace uidbox
