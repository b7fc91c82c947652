//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runTypeDescriptorTests();
bool runRuntimeValueTests();
bool runNamingPolicyTests();
bool runGoCodeTests();
bool runLiteralFormatTests();
bool runTypeExpressionTests();
bool runValueEncoderTests();
bool runGoFileTests();
bool runEmitCommonTests();
bool runDiagnosticsTests();
bool runValueDocumentTests();
bool runDiscoveryTests();
bool runGenerateConfigTests();
bool runGenerateTests();

int main()
{
    bool ok = true;
    ok      = runTypeDescriptorTests() && ok;
    ok      = runRuntimeValueTests() && ok;
    ok      = runNamingPolicyTests() && ok;
    ok      = runGoCodeTests() && ok;
    ok      = runLiteralFormatTests() && ok;
    ok      = runTypeExpressionTests() && ok;
    ok      = runValueEncoderTests() && ok;
    ok      = runGoFileTests() && ok;
    ok      = runEmitCommonTests() && ok;
    ok      = runDiagnosticsTests() && ok;
    ok      = runValueDocumentTests() && ok;
    ok      = runDiscoveryTests() && ok;
    ok      = runGenerateConfigTests() && ok;
    ok      = runGenerateTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
