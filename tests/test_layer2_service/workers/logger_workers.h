// tests/test_layer2_service/workers/logger_workers.h
#pragma once
/**
 * @file logger_workers.h
 * @brief Worker functions for Logger isolated-process tests.
 */
#include <string>

namespace bmapcopy::tests::worker::logger
{

int file_sink_receives_messages(const std::string &log_path);
int level_filtering(const std::string &log_path);
int switch_back_to_console(const std::string &log_path);
int unopenable_logfile_keeps_console(const std::string &log_path);
int messages_before_init_are_dropped();
int config_before_init_panics();
int multithread_messages_all_written(const std::string &log_path);

} // namespace bmapcopy::tests::worker::logger
