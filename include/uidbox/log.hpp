/*

log.hpp
-------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "export.hpp"


namespace uidbox
{


/**
Name under which the library logger is registered with spdlog.
**/
UIDBOX_EXPORT extern const std::string LOGGER_NAME;


/**
Getting the library logger.

If the application already registered a logger under `LOGGER_NAME`, that one is used, otherwise a colored stderr logger is created on the
first call. The default level is `warn`.

@return Shared library logger.
**/
UIDBOX_EXPORT std::shared_ptr<spdlog::logger> logger();


} // namespace uidbox
