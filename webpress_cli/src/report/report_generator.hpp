//
// Created by Giuseppe Francione on 18/01/26.
//

#ifndef WEBPRESS_REPORT_GENERATOR_HPP
#define WEBPRESS_REPORT_GENERATOR_HPP

#include "../../../libwebpress/include/summary.hpp"
#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>

/**
 * @brief Prints the per-folder result table and the run totals.
 */
void print_console_report(const webpress::RunSummary& summary,
                          std::ostream& out = std::cerr);

/**
 * @brief Writes the per-folder results and the totals as CSV.
 * @return false if the file cannot be written.
 */
bool export_csv_report(const webpress::RunSummary& summary,
                       const std::filesystem::path& output_path);

/**
 * @brief Percentage saved, 0 when nothing was measured.
 */
double reduction_percent(std::uintmax_t before, std::uintmax_t after);

std::string csv_escape(const std::string& data);

unsigned get_terminal_width();

#endif // WEBPRESS_REPORT_GENERATOR_HPP
