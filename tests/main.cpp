//
// Created by moinshaikh on 2/25/26.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include<doctest/doctest.h>
