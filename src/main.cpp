// fastpass_sim: two-class non-preemptive priority M/M/1 simulation
// Example runs:
// ./fastpass_sim --rates 0.5,0.95 --fsteps 20 --horizonT 50000 --warmup 5000 --seed 42 --outdir .
// ./fastpass_sim --rates 0.95 --f 0.65 --seed 7
// ./fastpass_sim --rates 0.95 --reps 10 --threads 4 --threshold 2.5 --maxRatio 20 --quiet
#include <iostream>

#include "fastpass/cli.hpp"

using namespace std;

int main(int argc, char* argv[]) {
    ios::sync_with_stdio(false);
    return fastpass::run_cli(argc, argv, cout, cerr);
}
