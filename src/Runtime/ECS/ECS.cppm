export module ECS;

export import :Query;
export import :Components;
export import :Scene;
export import :Systems.Movement;
