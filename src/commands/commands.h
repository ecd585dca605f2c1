#pragma once

int run_gearpicture(int argc, char** argv);
int run_gearicon(int argc, char** argv);
