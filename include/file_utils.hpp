#pragma once

#include <filesystem>
#include <string>

// Получение текущего времени в формате для имени файла
std::string getCurrentTimeString();

// Сравнение расширения файла без учёта регистра
bool hasExtension(const std::filesystem::path& path, const std::string& ext);

// Путь отчёта по умолчанию: рядом со скриптом, <имя>_results_<время>.csv
std::filesystem::path defaultReportPath(const std::filesystem::path& scriptPath);

// Приводит пользовательский путь отчёта к расширению .csv
std::filesystem::path normalizeReportPath(std::filesystem::path reportPath);
