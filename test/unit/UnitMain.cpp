//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runJsonRpcIOTests();
bool runProtocolTests();
bool runServerConfigTests();
bool runTelemetryTests();
bool runServerProcessTests();
bool runServerSessionTests();
bool runClientHandleTests();
bool runServerManagerTests();
bool runToolHandlersTests();

int main()
{
    bool ok = true;
    ok      = runJsonRpcIOTests() && ok;
    ok      = runProtocolTests() && ok;
    ok      = runServerConfigTests() && ok;
    ok      = runTelemetryTests() && ok;
    ok      = runServerProcessTests() && ok;
    ok      = runServerSessionTests() && ok;
    ok      = runClientHandleTests() && ok;
    ok      = runServerManagerTests() && ok;
    ok      = runToolHandlersTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
