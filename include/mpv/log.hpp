#pragma once

#include <memory>
#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>

namespace mpv
{
    namespace log
    {
        constexpr const char *LoggerName = "mpv";

        namespace detail
        {
            inline std::mutex &logger_mutex( )
            {
                static std::mutex mtx;
                return mtx;
            }

            inline std::shared_ptr< spdlog::logger > &logger_slot( )
            {
                static std::shared_ptr< spdlog::logger > slot { };
                return slot;
            }

            /**
             * @brief Set while `logger_slot( )` holds the silent stand-in rather than a real logger.
             */
            inline bool &logger_is_fallback( )
            {
                static bool fallback { false };
                return fallback;
            }
        }

        /**
         * @brief Logger used by the codec. An application that registered a logger named `mpv`
         * with spdlog gets that one, whether it was registered before or after the codec first logged.
         * Until then a silent logger stands in.
         * @return std::shared_ptr< spdlog::logger >
         */
        inline std::shared_ptr< spdlog::logger > logger( )
        {
            std::lock_guard< std::mutex > lock( detail::logger_mutex ( ) );

            auto &slot = detail::logger_slot ( );
            auto &fallback = detail::logger_is_fallback ( );

            if ( !slot || fallback )
            {
                if ( auto registered = spdlog::get( LoggerName ) )
                {
                    slot = std::move( registered );
                    fallback = false;
                }
                else if ( !slot )
                {
                    slot = std::make_shared< spdlog::logger >(
                        LoggerName,
                        std::make_shared< spdlog::sinks::null_sink_mt > ( )
                    );
                    fallback = true;
                }
            }

            return slot;
        }

        /**
         * @brief Route codec log output through `replacement`. Passing `nullptr` restores the default lookup.
         * @param replacement Logger to use from now on
         */
        inline void set_logger( std::shared_ptr< spdlog::logger > replacement )
        {
            std::lock_guard< std::mutex > lock( detail::logger_mutex ( ) );

            detail::logger_slot ( ) = std::move( replacement );
            detail::logger_is_fallback ( ) = false;
        }
    }
}
