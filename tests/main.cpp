#include <iostream>

void run_tokenizer_tests();
void run_parser_tests();
void run_overload_tests();
void run_evaluator_tests();
void run_record_factory_tests();
void run_queryable_tests();
void run_repository_tests();
void run_diagnostics_tests();

int main(){
    run_tokenizer_tests();
    run_parser_tests();
    run_overload_tests();
    run_evaluator_tests();
    run_record_factory_tests();
    run_queryable_tests();
    run_repository_tests();
    run_diagnostics_tests();
    std::cout << "All tests passed\n";
    return 0;
}
