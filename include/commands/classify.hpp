#pragma once

int cmd_classify(int argc, char** argv);
