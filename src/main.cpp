#include <exception>
#include <iostream>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

#include "App.h"
#include "Diagnostics.h"
#include "TransitionTable.h"

static void setupConsoleUtf8() {
#ifdef _WIN32
    // Если консоль не подключена, ничего не делать.
    if (GetConsoleWindow() == nullptr) {
        return;
    }

    // Метки "Θ", "δ" и "→" хранятся в UTF-8; устанавливаем соответствующие кодовые страницы консоли.
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif
}

static const char* levelName(DiagnosticLevel level) {
    switch (level) {
    case DiagnosticLevel::Error:
        return "Error";
    case DiagnosticLevel::Warning:
        return "Warning";
    case DiagnosticLevel::Info:
        return "Info";
    }
    return "Error";
}

int main() {
    setupConsoleUtf8();

    try {
        const TransitionTable& table = TransitionTable::standard();

        std::vector<Diagnostic> diags;
        const bool valid = table.validate(diags);
        for (const auto& diag : diags) {
            std::cerr << "Table " << levelName(diag.level) << ": " << diag.message << std::endl;
        }
        if (!valid) {
            return 1;
        }

        App app(std::cin, std::cout, table);
        return app.run();
    } catch (const std::exception& ex) {
        std::cerr << std::endl << ex.what() << std::endl;
        return 1;
    }
}
