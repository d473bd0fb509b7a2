#pragma once

#include <string>

// Удаление пробелов и табуляций по краям строки
std::string trim(const std::string& text);

// Разбор операнда из строки.
// Строка должна целиком быть числом; результат проверяется validateNumber.
// Выбрасывает calc::InvalidInputError.
double parseOperand(const std::string& text);

// Чтение строки с приглашением. Возвращает false при конце ввода
bool readLine(const std::string& prompt, std::string& line);
