#pragma once

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace CubeLink {

    class AccessCode {
    public:
        // Random 6-digit code, zero-padded ("000000" - "999999")
        static std::string generate() {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_int_distribution<int> dis(0, 999999);

            std::ostringstream code;
            code << std::setw(6) << std::setfill('0') << dis(gen);
            return code.str();
        }

        // Exactly six ASCII digits
        static bool isValid(const std::string& code) {
            if (code.length() != 6) return false;

            for (char c : code) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }

            return true;
        }

        // Display form, e.g. 123-456
        static std::string format(const std::string& code) {
            if (code.length() != 6) return code;
            return code.substr(0, 3) + "-" + code.substr(3, 3);
        }

        // Strip dashes and spaces from user input
        static std::string normalize(const std::string& code) {
            std::string normalized;
            for (char c : code) {
                if (c != '-' && c != ' ') {
                    normalized += c;
                }
            }
            return normalized;
        }
    };

}
