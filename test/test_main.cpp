#include <iostream>

void test_structure();
void test_numbers();
void test_strings();
void test_errors();
void test_feeders();
void test_random();
void test_reference();

int main() {
  test_structure();
  test_numbers();
  test_strings();
  test_errors();
  test_feeders();
  test_reference();
  test_random();

  std::cout << "feedjson tests passed\n";
  return 0;
}
