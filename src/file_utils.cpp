#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// Получение текущего времени в формате для имени файла
std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

bool hasExtension(const std::filesystem::path& path, const std::string& ext) {
    std::string pathExt = path.extension().string();
    if (pathExt.empty()) {
        return false;
    }

    // Приводим к нижнему регистру для сравнения
    std::string lowerExt = ext;
    auto toLower = [](unsigned char c) { return static_cast<char>(std::tolower(c)); };
    std::transform(pathExt.begin(), pathExt.end(), pathExt.begin(), toLower);
    std::transform(lowerExt.begin(), lowerExt.end(), lowerExt.begin(), toLower);

    return pathExt == lowerExt;
}

std::filesystem::path defaultReportPath(const std::filesystem::path& scriptPath) {
    std::string stem = scriptPath.stem().string();
    return scriptPath.parent_path() / (stem + "_results_" + getCurrentTimeString() + ".csv");
}

std::filesystem::path normalizeReportPath(std::filesystem::path reportPath) {
    // Добавляем .csv если его нет
    if (!hasExtension(reportPath, ".csv")) {
        reportPath.replace_extension(".csv");
    }
    return reportPath;
}
