#include "FinanceApp.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        FinanceApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Finance Ledger Starting" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        int code = app.run(argc, argv);

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Finance Ledger Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return code;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
