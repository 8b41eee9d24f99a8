#pragma once

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/severity.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iomanip>
#include <iostream>
#include <string>

namespace Mintguard
{

using MintguardLogger = boost::log::trivial::logger_type;

// Macro that includes severity, filename and line number.
#define MINTGUARD_LOG( logger, sev ) \
    BOOST_LOG_STREAM_SEV( logger, sev ) \
            << boost::log::add_value( "Line", __LINE__ ) \
            << boost::log::add_value( "File", __FILE__ ) \
            << boost::log::add_value( "Function", __FUNCTION__ )

// Macros to log to local logger.
#define MINTGUARD_LOG_DEBUG( logger ) MINTGUARD_LOG( logger, boost::log::trivial::severity_level::debug )
#define MINTGUARD_LOG_INFO( logger ) MINTGUARD_LOG( logger, boost::log::trivial::severity_level::info )
#define MINTGUARD_LOG_WARNING( logger ) MINTGUARD_LOG( logger, boost::log::trivial::severity_level::warning )
#define MINTGUARD_LOG_ERROR( logger ) MINTGUARD_LOG( logger, boost::log::trivial::severity_level::error )

// Logs go to stderr so that stdout can carry inspection records.
inline void init_logger( boost::log::trivial::severity_level logLevel )
{
    boost::log::add_console_log
    (
        std::clog,
        boost::log::keywords::format = boost::log::expressions::stream <<
        "["   << boost::log::expressions::format_date_time< boost::posix_time::ptime >( "TimeStamp", "%Y-%m-%d %H:%M:%S.%f" ) <<
        "] [" << std::left << std::setw( 7 ) << std::setfill(' ') << boost::log::trivial::severity <<
        "] "  << boost::log::expressions::smessage <<
        " ("  << boost::log::expressions::attr< std::string >( "File" ) <<
        ":"   << boost::log::expressions::attr< int >( "Line" ) <<
        ":"   << boost::log::expressions::attr< std::string >( "Function" ) <<
        ")",
        boost::log::keywords::filter = boost::log::trivial::severity >= logLevel
    );

    boost::log::add_common_attributes( );
}

} // namespace Mintguard
