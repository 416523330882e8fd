#pragma once

// Contract: call once from setup(). Validates settings, starts logging, WiFi and the agent.
void appSetup();

// Contract: call from loop(). Handles serial commands; the agent runs in its own tasks.
void appLoop();
