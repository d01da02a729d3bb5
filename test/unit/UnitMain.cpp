//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runCodeEmitterTests();
bool runComposerTests();
bool runConfigTests();
bool runConversionRegistryTests();
bool runDeclarationLocatorTests();
bool runDriverTests();
bool runFieldSelectorTests();
bool runGenerationErrorTests();
bool runMemberInsertionTests();
bool runModelReaderTests();
bool runNamingPolicyTests();
bool runRuntimeTests();
bool runSourcePatcherTests();
bool runTypeSpellingTests();

int main()
{
    bool ok = true;
    ok      = runCodeEmitterTests() && ok;
    ok      = runComposerTests() && ok;
    ok      = runConfigTests() && ok;
    ok      = runConversionRegistryTests() && ok;
    ok      = runDeclarationLocatorTests() && ok;
    ok      = runDriverTests() && ok;
    ok      = runFieldSelectorTests() && ok;
    ok      = runGenerationErrorTests() && ok;
    ok      = runMemberInsertionTests() && ok;
    ok      = runModelReaderTests() && ok;
    ok      = runNamingPolicyTests() && ok;
    ok      = runRuntimeTests() && ok;
    ok      = runSourcePatcherTests() && ok;
    ok      = runTypeSpellingTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
