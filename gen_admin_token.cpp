#include <cstdlib>
#include <iostream>
#include <string>

#include "jwt_utils.h"

// Выпускает admin-JWT для ручной работы с API (curl, фронт в dev-режиме)
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <userId> [ttlSeconds] [role]\n";
        return 1;
    }

    const char* secret = std::getenv("TIMETABLE_JWT_SECRET");
    if (!secret || !*secret) {
        std::cerr << "Environment variable TIMETABLE_JWT_SECRET is not set\n";
        return 1;
    }

    long userId;
    int ttl;
    try {
        userId = std::stol(argv[1]);
        ttl    = argc >= 3 ? std::stoi(argv[2]) : 3600;
    } catch (const std::exception&) {
        std::cerr << "userId и ttlSeconds должны быть числами\n";
        return 1;
    }
    std::string role = argc >= 4 ? argv[3] : "admin";

    std::cout << createJwt(userId, role, secret, ttl) << std::endl;
    return 0;
}
